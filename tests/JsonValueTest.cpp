#include "JsonValue.h"
#include "NikaExceptions.h"

#include <gtest/gtest.h>

#include <limits>
#include <string>

TEST(JsonValueTest, ParsesNestedDocumentInOrder) {
    const JsonValue doc = parseJsonText(R"({"b": [1, 2.5, -3e2], "a": {"x": null, "y": true}, "s": "hi"})");
    ASSERT_TRUE(doc.isObject());
    ASSERT_EQ(doc.objectValue.size(), 3u);
    EXPECT_EQ(doc.objectValue[0].first, "b");
    EXPECT_EQ(doc.objectValue[1].first, "a");

    const JsonValue* b = doc.find("b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->isArray());
    EXPECT_DOUBLE_EQ(b->arrayValue[2].numberValue, -300.0);

    const JsonValue* a = doc.find("a");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->find("x")->isNull());
    EXPECT_TRUE(a->find("y")->booleanValue);
    EXPECT_EQ(doc.find("missing"), nullptr);
    EXPECT_EQ(doc.find("s")->find("s"), nullptr);
}

TEST(JsonValueTest, DecodesUnicodeEscapes) {
    EXPECT_EQ(parseJsonText(R"("caf\u00e9")").stringValue, "caf\xC3\xA9");
    EXPECT_EQ(parseJsonText(R"("\ud83d\ude00")").stringValue, "\xF0\x9F\x98\x80");
    EXPECT_EQ(parseJsonText(R"("a\nb\/c")").stringValue, "a\nb/c");
}

TEST(JsonValueTest, RejectsMalformedInput) {
    EXPECT_THROW(parseJsonText(""), Nika::RequestException);
    EXPECT_THROW(parseJsonText("{\"a\": 1"), Nika::RequestException);
    EXPECT_THROW(parseJsonText("{\"a\": 1} extra"), Nika::RequestException);
    EXPECT_THROW(parseJsonText("[1,]"), Nika::RequestException);
    EXPECT_THROW(parseJsonText("{a: 1}"), Nika::RequestException);
    EXPECT_THROW(parseJsonText(R"("\ud83d")"), Nika::RequestException);
    EXPECT_THROW(parseJsonText("tru"), Nika::RequestException);
}

TEST(JsonValueTest, DumpIsCompactAndOrdered) {
    JsonValue out = JsonValue::makeObject();
    out.set("z", JsonValue::makeNumber(12));
    out.set("a", JsonValue::makeString("q\"t\x01"));
    JsonValue list = JsonValue::makeArray();
    list.push(JsonValue::makeNumber(0.5));
    list.push(JsonValue{});
    out.set("list", std::move(list));
    out.set("z", JsonValue::makeNumber(13));

    EXPECT_EQ(out.dump(), R"({"z":13,"a":"q\"t\u0001","list":[0.5,null]})");
}

TEST(JsonValueTest, NonFiniteNumbersDumpAsNull) {
    EXPECT_EQ(formatJsonNumber(std::numeric_limits<double>::infinity()), "null");
    EXPECT_EQ(formatJsonNumber(std::numeric_limits<double>::quiet_NaN()), "null");
    EXPECT_EQ(formatJsonNumber(7.0), "7");
    EXPECT_EQ(formatJsonNumber(-2.5), "-2.5");
}

TEST(JsonValueTest, NumbersRoundTripExactly) {
    for (double v : {0.1, 1.0 / 3.0, 123456.78901234567, -9.8765432109876e-7, 1e300}) {
        EXPECT_EQ(parseJsonText(formatJsonNumber(v)).numberValue, v) << formatJsonNumber(v);
    }
}

TEST(JsonValueTest, RepeatedKeysKeepLastValue) {
    const JsonValue doc = parseJsonText(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_EQ(doc.objectValue.size(), 2u);
    EXPECT_EQ(doc.objectValue[0].first, "a");
    EXPECT_DOUBLE_EQ(doc.find("a")->numberValue, 3.0);
    EXPECT_DOUBLE_EQ(doc.find("b")->numberValue, 2.0);
}

TEST(JsonValueTest, RejectsExcessiveNesting) {
    const std::string deep = std::string(300, '[') + std::string(300, ']');
    try {
        parseJsonText(deep);
        FAIL() << "expected RequestException";
    } catch (const Nika::RequestException& e) {
        EXPECT_NE(std::string(e.what()).find("nesting too deep"), std::string::npos);
    }

    EXPECT_THROW(parseJsonText(std::string(200000, '[')), Nika::RequestException);

    const JsonValue shallow = parseJsonText(std::string(100, '[') + std::string(100, ']'));
    EXPECT_TRUE(shallow.isArray());
}
