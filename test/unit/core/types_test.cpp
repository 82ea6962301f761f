#include "promptline/core/errors.hpp"
#include "promptline/core/types.hpp"
#include "promptline/prompt_manager/request_builder.hpp"
#include <gtest/gtest.h>

namespace promptline {
using json = nlohmann::json;

TEST(DocumentTest, ToJsonOmitsMissingScore) {
    Document with_score{"d1", "text", 0.25};
    Document without_score{"d2", "other", std::nullopt};

    EXPECT_EQ(with_score.ToJson(), (json{{"id", "d1"}, {"text", "text"}, {"score", 0.25}}));
    EXPECT_EQ(without_score.ToJson(), (json{{"id", "d2"}, {"text", "other"}}));
    EXPECT_EQ(Document::FromJson(with_score.ToJson()), with_score);
    EXPECT_EQ(Document::FromJson(without_score.ToJson()), without_score);
}

TEST(DocumentTest, FromJsonRequiresText) {
    EXPECT_THROW(Document::FromJson(json{{"id", "d1"}}), InvalidArgumentError);
    EXPECT_THROW(Document::FromJson(json{{"text", 5}}), InvalidArgumentError);
    EXPECT_THROW(Document::FromJson(json("text")), InvalidArgumentError);

    auto document = Document::FromJson(json{{"text", "only text"}});
    EXPECT_EQ(document.id, "");
    EXPECT_FALSE(document.score.has_value());
}

TEST(DocumentTest, ToString) {
    EXPECT_EQ((Document{"d1", "a \"quoted\" text", std::nullopt}).ToString(),
              R"(Document(id="d1", text="a \"quoted\" text"))");
    EXPECT_EQ((Document{"d1", "t", 0.5}).ToString(), R"(Document(id="d1", text="t", score=0.5))");
}

TEST(RequestTest, Parameters) {
    auto request = RequestBuilder().SetPrompt("Q").SetTemperature(0.5).SetMaxTokens(32).Build();
    EXPECT_EQ(request.GetParameters(), (json{{"temperature", 0.5}, {"max_tokens", 32}}));
}

TEST(RequestTest, ToString) {
    auto request = RequestBuilder().SetPrompt("Hi").SetTemperature(0.5).SetMaxTokens(10).Build();
    EXPECT_EQ(request.ToString(), R"(Request(prompt_text="Hi", temperature=0.5, max_tokens=10))");
}

TEST(RequestTest, JsonRecord) {
    auto request = RequestBuilder().SetPrompt("Q").SetTemperature(0.5).SetMaxTokens(32).Build();
    auto record = request.ToJson();
    EXPECT_EQ(record["prompt_text"], "Q");
    EXPECT_EQ(Request::FromJson(record), request);
}

// A record is revalidated on the way in
TEST(RequestTest, FromJsonValidates) {
    EXPECT_THROW(Request::FromJson(json{{"prompt_text", ""}}), InvalidRequestError);
    EXPECT_THROW(Request::FromJson(json{{"prompt_text", "Q"}, {"temperature", 9.0}}), InvalidRequestError);
    EXPECT_THROW(Request::FromJson(json{{"prompt_text", "Q"}, {"max_tokens", "lots"}}), InvalidRequestError);
    EXPECT_THROW(Request::FromJson(json::array()), InvalidRequestError);

    auto request = Request::FromJson(json{{"prompt_text", "Q"}});
    EXPECT_DOUBLE_EQ(request.temperature(), 1.0);
    EXPECT_EQ(request.max_tokens(), 100);
}

TEST(RequestTest, FromJsonRejectsMaxTokensOutsideIntRange) {
    EXPECT_THROW(Request::FromJson(json{{"prompt_text", "Q"}, {"max_tokens", 4294967297LL}}), InvalidRequestError);
    EXPECT_THROW(Request::FromJson(json::parse(R"({"prompt_text": "Q", "max_tokens": 18446744073709551615})")),
                 InvalidRequestError);
    EXPECT_THROW(Request::FromJson(json{{"prompt_text", "Q"}, {"max_tokens", 12.5}}), InvalidRequestError);

    EXPECT_EQ(Request::FromJson(json{{"prompt_text", "Q"}, {"max_tokens", 64}}).max_tokens(), 64);
}

TEST(ResultTest, JsonRecord) {
    Result result{"answer", json{{"response", "answer"}, {"usage", 12}}};
    EXPECT_EQ(Result::FromJson(result.ToJson()), result);
    EXPECT_THROW(Result::FromJson(json{{"raw", nullptr}}), InvalidArgumentError);
}

TEST(ErrorTest, MessageCarriesComponentAndReason) {
    UnknownModelError error("gpt-5");
    EXPECT_STREQ(error.what(), "[AdapterRegistry] error. Reason: model `gpt-5` is not registered");
    EXPECT_EQ(error.component(), "AdapterRegistry");

    // every error is catchable as the common base
    try {
        throw RetrievalError("offline");
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.component(), "Retrieval");
        EXPECT_EQ(e.reason(), "offline");
    }
}

}// namespace promptline
