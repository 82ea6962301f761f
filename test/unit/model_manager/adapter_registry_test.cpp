#include "mocks.hpp"
#include "promptline/model_manager/adapter_registry.hpp"
#include "promptline/prompt_manager/request_builder.hpp"
#include "nlohmann/json.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <type_traits>

namespace promptline {
using json = nlohmann::json;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

// Backends with different native method names answer through one contract
TEST(AdapterRegistryTest, NormalizesDifferentEntryPoints) {
    AdapterRegistry registry;
    registry.Register("gpt-4o", std::make_shared<QueryBackend>("OpenAI"), "query");
    registry.Register("mistral-7b", std::make_shared<GenerateBackend>("HuggingFace", "bitsandbytes"), "generate");

    auto openai_result = registry.Invoke("gpt-4o", "What is Python?");
    EXPECT_EQ(openai_result.text, "OpenAI response to: What is Python?");
    EXPECT_EQ(openai_result.raw, json("OpenAI response to: What is Python?"));

    auto hf_result = registry.Invoke("mistral-7b", "What is Python?");
    EXPECT_EQ(hf_result.text, "HuggingFace response to: What is Python?");
    EXPECT_EQ(hf_result.raw["quantization"], "bitsandbytes");
}

// Exposed operations call back into the backend that registered them
static_assert(!std::is_copy_constructible_v<QueryBackend>, "backends must not be copyable");
static_assert(!std::is_move_constructible_v<QueryBackend>, "backends must not be movable");
static_assert(!std::is_copy_assignable_v<IModelBackend>, "backends must not be assignable");

TEST(AdapterRegistryTest, BackendListsExposedOperations) {
    MockBackend backend;
    EXPECT_EQ(backend.GetOperationNames(), (std::vector<std::string>{"generate", "generate_with_parameters"}));
    EXPECT_TRUE(backend.FindOperation("generate").has_value());
    EXPECT_FALSE(backend.FindOperation("query").has_value());
}

TEST(AdapterRegistryTest, DuplicateModelIdIsRejected) {
    AdapterRegistry registry;
    registry.Register("m1", std::make_shared<QueryBackend>("first"), "query");

    EXPECT_THROW(registry.Register("m1", std::make_shared<QueryBackend>("second"), "query"), DuplicateModelError);
    EXPECT_EQ(registry.Invoke("m1", "x").text, "first response to: x");
    EXPECT_EQ(registry.Size(), 1);
}

TEST(AdapterRegistryTest, UnknownModelNeverReachesABackend) {
    auto backend = std::make_shared<MockBackend>();
    EXPECT_CALL(*backend, Generate(_)).Times(0);

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate");

    EXPECT_THROW(registry.Invoke("nonexistent", "x"), UnknownModelError);
    try {
        registry.Invoke("nonexistent", "x");
        FAIL() << "expected UnknownModelError";
    } catch (const UnknownModelError& e) {
        EXPECT_EQ(e.model_id(), "nonexistent");
    }
}

TEST(AdapterRegistryTest, EntryPointIsResolvedAtRegistration) {
    AdapterRegistry registry;
    EXPECT_THROW(registry.Register("m1", std::make_shared<QueryBackend>("OpenAI"), "generate"), InvalidArgumentError);
    EXPECT_THROW(registry.Register("m1", nullptr, "generate"), InvalidArgumentError);
    EXPECT_THROW(registry.Register("", std::make_shared<QueryBackend>("OpenAI"), "query"), InvalidArgumentError);
    EXPECT_THROW(registry.Register("m1", IModelBackend::Operation()), InvalidArgumentError);
    EXPECT_FALSE(registry.Contains("m1"));
}

TEST(AdapterRegistryTest, BackendExceptionBecomesBackendError) {
    auto backend = std::make_shared<MockBackend>();
    EXPECT_CALL(*backend, Generate("boom")).WillOnce(Throw(std::runtime_error("connection refused")));

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate");

    try {
        registry.Invoke("m1", "boom");
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.model_id(), "m1");
        EXPECT_EQ(e.detail(), json("connection refused"));
        EXPECT_NE(std::string(e.what()).find("connection refused"), std::string::npos);
    }
}

TEST(AdapterRegistryTest, ErrorPayloadBecomesBackendErrorWithDetail) {
    auto backend = std::make_shared<MockBackend>();
    const json error = {{"message", "rate limited"}, {"code", 429}};
    EXPECT_CALL(*backend, Generate(_)).WillOnce(Return(json{{"error", error}}));

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate");

    try {
        registry.Invoke("m1", "x");
        FAIL() << "expected BackendError";
    } catch (const BackendError& e) {
        EXPECT_EQ(e.reason(), "`m1`: rate limited");
        EXPECT_EQ(e.detail(), error);
    }
}

TEST(AdapterRegistryTest, NullPayloadIsABackendError) {
    auto backend = std::make_shared<MockBackend>();
    EXPECT_CALL(*backend, Generate(_)).WillOnce(Return(json()));

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate");
    EXPECT_THROW(registry.Invoke("m1", "x"), BackendError);
}

TEST(AdapterRegistryTest, RequestParametersReachParameterAwareOperations) {
    auto backend = std::make_shared<MockBackend>();
    const json expected_parameters = {{"temperature", 0.7}, {"max_tokens", 50}};
    EXPECT_CALL(*backend, GenerateWithParameters("Q3", expected_parameters)).WillOnce(Return(json("A3")));

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate_with_parameters");

    auto request = RequestBuilder().SetPrompt("Q3").SetTemperature(0.7).SetMaxTokens(50).Build();
    EXPECT_EQ(registry.Invoke("m1", request).text, "A3");
}

TEST(AdapterRegistryTest, CallableRegistration) {
    AdapterRegistry registry;
    registry.Register("echo", [](const std::string& prompt, const json&) { return json{{"text", prompt}}; });

    EXPECT_TRUE(registry.Contains("echo"));
    EXPECT_EQ(registry.Invoke("echo", "hello").text, "hello");
}

TEST(AdapterRegistryTest, UnregisterRemovesBinding) {
    AdapterRegistry registry;
    registry.Register("m1", std::make_shared<QueryBackend>("OpenAI"), "query");
    registry.Register("m2", std::make_shared<QueryBackend>("OpenAI"), "query");

    EXPECT_EQ(registry.GetModelIds(), (std::vector<std::string>{"m1", "m2"}));
    EXPECT_TRUE(registry.Unregister("m1"));
    EXPECT_FALSE(registry.Unregister("m1"));
    EXPECT_THROW(registry.Invoke("m1", "x"), UnknownModelError);

    // the id can be bound again once released
    registry.Register("m1", std::make_shared<QueryBackend>("Other"), "query");
    EXPECT_EQ(registry.Invoke("m1", "x").text, "Other response to: x");
}

TEST(AdapterRegistryTest, ExtractText) {
    EXPECT_EQ(AdapterRegistry::ExtractText(json("plain")), "plain");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"text", "a"}}), "a");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"response", "b"}}), "b");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"content", "c"}}), "c");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"output", "d"}}), "d");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"choices", {{{"message", {{"role", "assistant"}, {"content", "e"}}}}}}}),
              "e");
    EXPECT_EQ(AdapterRegistry::ExtractText(json{{"items", {1, 2}}}), R"({"items":[1,2]})");
    EXPECT_EQ(AdapterRegistry::ExtractText(json(42)), "42");
}

TEST(AdapterRegistryTest, InvokeTimesOutOnSlowBackend) {
    AdapterRegistry registry;
    registry.Register("slow", [](const std::string& prompt, const json&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return json(prompt);
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(registry.Invoke("slow", "x", CancellationToken::WithTimeout(std::chrono::milliseconds(20))),
                 TimeoutError);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(250));
}

TEST(AdapterRegistryTest, InvokeWithDeadlineReturnsWhenBackendIsFast) {
    AdapterRegistry registry;
    registry.Register("m1", std::make_shared<QueryBackend>("OpenAI"), "query");

    auto result = registry.Invoke("m1", "x", CancellationToken::WithTimeout(std::chrono::seconds(5)));
    EXPECT_EQ(result.text, "OpenAI response to: x");
}

TEST(AdapterRegistryTest, CancelledTokenNeverCallsBackend) {
    auto backend = std::make_shared<MockBackend>();
    EXPECT_CALL(*backend, Generate(_)).Times(0);

    AdapterRegistry registry;
    registry.Register("m1", backend, "generate");

    auto token = CancellationToken::Cancellable();
    token.Cancel();
    EXPECT_THROW(registry.Invoke("m1", "x", token), TimeoutError);
}

TEST(AdapterRegistryTest, RecordsInvocationMetrics) {
    auto metrics = std::make_shared<MetricsManager>();
    AdapterRegistry registry(metrics);
    registry.Register("ok", std::make_shared<QueryBackend>("OpenAI"), "query");
    registry.Register("failing", [](const std::string&, const json&) -> json { throw std::runtime_error("down"); });

    registry.Invoke("ok", "a");
    registry.Invoke("ok", "b");
    EXPECT_THROW(registry.Invoke("failing", "c"), BackendError);

    auto ok_metrics = metrics->GetStageMetrics("ok", PipelineStage::INVOKE);
    EXPECT_EQ(ok_metrics.calls, 2);
    EXPECT_EQ(ok_metrics.failures, 0);

    auto failing_metrics = metrics->GetStageMetrics("failing", PipelineStage::INVOKE);
    EXPECT_EQ(failing_metrics.calls, 1);
    EXPECT_EQ(failing_metrics.failures, 1);
}

TEST(AdapterRegistryTest, ConcurrentInvokesWhileRegistering) {
    AdapterRegistry registry;
    registry.Register("m1", std::make_shared<QueryBackend>("OpenAI"), "query");

    std::atomic<int> successes{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&registry, &successes, i]() {
            for (int j = 0; j < 50; ++j) {
                auto prompt = std::to_string(i) + ":" + std::to_string(j);
                if (registry.Invoke("m1", prompt).text == "OpenAI response to: " + prompt) {
                    successes++;
                }
            }
        });
    }
    for (int i = 0; i < 20; ++i) {
        registry.Register("extra_" + std::to_string(i), std::make_shared<QueryBackend>("Extra"), "query");
    }
    for (auto& worker: workers) {
        worker.join();
    }

    EXPECT_EQ(successes.load(), 8 * 50);
    EXPECT_EQ(registry.Size(), 21);
}

}// namespace promptline
