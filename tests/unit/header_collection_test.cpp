#include <relay/http/header_collection.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace relay::http;

// ---------------------------------------------------------------------------
// 1. add / value
// ---------------------------------------------------------------------------
TEST(HeaderCollectionTest, AddAndValue) {
    HeaderCollection headers;
    headers.add("Content-Type", "text/html");
    ASSERT_TRUE(headers.value("Content-Type").has_value());
    EXPECT_EQ(headers.value("Content-Type").value(), "text/html");
}

TEST(HeaderCollectionTest, ValueIsExactNameMatch) {
    HeaderCollection headers;
    headers.add("Content-Type", "text/html");
    EXPECT_FALSE(headers.value("content-type").has_value());
    EXPECT_FALSE(headers.value("CONTENT-TYPE").has_value());
}

TEST(HeaderCollectionTest, ValueReturnsNulloptForMissingName) {
    HeaderCollection headers;
    EXPECT_FALSE(headers.value("X-Missing").has_value());
}

TEST(HeaderCollectionTest, ValueReturnsFirstOfDuplicates) {
    HeaderCollection headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("Set-Cookie", "b=2");
    EXPECT_EQ(headers.value("Set-Cookie").value(), "a=1");
    EXPECT_EQ(headers.size(), 2u);
}

TEST(HeaderCollectionTest, ValuesReturnsAllInOrder) {
    HeaderCollection headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("Host", "example.com");
    headers.add("Set-Cookie", "b=2");

    auto all = headers.values("Set-Cookie");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], "a=1");
    EXPECT_EQ(all[1], "b=2");
}

// ---------------------------------------------------------------------------
// 2. remove / replace
// ---------------------------------------------------------------------------
TEST(HeaderCollectionTest, RemoveDeletesEveryMatch) {
    HeaderCollection headers;
    headers.add("Set-Cookie", "a=1");
    headers.add("Host", "example.com");
    headers.add("Set-Cookie", "b=2");

    headers.remove("Set-Cookie");
    EXPECT_FALSE(headers.has("Set-Cookie"));
    EXPECT_TRUE(headers.has("Host"));
    EXPECT_EQ(headers.size(), 1u);
}

TEST(HeaderCollectionTest, RemoveNonexistentNameIsNoop) {
    HeaderCollection headers;
    headers.add("Host", "example.com");
    headers.remove("X-Missing");
    EXPECT_EQ(headers.size(), 1u);
}

TEST(HeaderCollectionTest, ReplaceLeavesExactlyOneField) {
    HeaderCollection headers;
    headers.add("Connection", "keep-alive");
    headers.add("Accept", "*/*");
    headers.add("Connection", "upgrade");

    headers.replace("Connection", "close");
    EXPECT_EQ(headers.value("Connection").value(), "close");
    EXPECT_EQ(headers.values("Connection").size(), 1u);
    EXPECT_EQ(headers.size(), 2u);
}

TEST(HeaderCollectionTest, ReplaceMovesFieldToEnd) {
    HeaderCollection headers;
    headers.add("Host", "localhost:8080");
    headers.add("Accept", "*/*");

    headers.replace("Host", "jira.domain.com");
    EXPECT_EQ(headers.serialize(), "Accept: */*\r\nHost: jira.domain.com\r\n");
}

TEST(HeaderCollectionTest, ReplaceOnEmptyCollectionAdds) {
    HeaderCollection headers;
    headers.replace("Connection", "close");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.value("Connection").value(), "close");
}

// ---------------------------------------------------------------------------
// 3. serialize
// ---------------------------------------------------------------------------
TEST(HeaderCollectionTest, SerializeKeepsInsertionOrder) {
    HeaderCollection headers;
    headers.add("Host", "example.com");
    headers.add("Set-Cookie", "a=1");
    headers.add("Set-Cookie", "b=2");
    EXPECT_EQ(headers.serialize(),
              "Host: example.com\r\nSet-Cookie: a=1\r\nSet-Cookie: b=2\r\n");
}

TEST(HeaderCollectionTest, SerializeEmptyCollection) {
    HeaderCollection headers;
    EXPECT_TRUE(headers.empty());
    EXPECT_EQ(headers.serialize(), "");
}

TEST(HeaderCollectionTest, FieldSerialize) {
    HeaderField field("X-Test", "");
    EXPECT_EQ(field.serialize(), "X-Test: \r\n");
}

// ---------------------------------------------------------------------------
// 4. iteration
// ---------------------------------------------------------------------------
TEST(HeaderCollectionTest, IterationIsRestartable) {
    HeaderCollection headers;
    headers.add("A", "1");
    headers.add("B", "2");

    for (int pass = 0; pass < 2; ++pass) {
        std::vector<std::string> names;
        for (const auto& field : headers) {
            names.push_back(field.name());
        }
        ASSERT_EQ(names.size(), 2u);
        EXPECT_EQ(names[0], "A");
        EXPECT_EQ(names[1], "B");
    }
}

TEST(HeaderCollectionTest, ForEachCanMutateEveryMatch) {
    HeaderCollection headers;
    headers.add("Set-Cookie", "a=1; Domain=jira.domain.com");
    headers.add("Host", "example.com");
    headers.add("Set-Cookie", "b=2; Domain=jira.domain.com");

    headers.for_each([](HeaderField& field) {
        if (field.name() != "Set-Cookie") return;
        std::string value = field.value();
        auto pos = value.find("; Domain=");
        if (pos != std::string::npos) {
            value.erase(pos);
        }
        field.set_value(value);
    });

    auto cookies = headers.values("Set-Cookie");
    ASSERT_EQ(cookies.size(), 2u);
    EXPECT_EQ(cookies[0], "a=1");
    EXPECT_EQ(cookies[1], "b=2");
    EXPECT_EQ(headers.value("Host").value(), "example.com");
}

TEST(HeaderCollectionTest, ConstForEachVisitsInOrder) {
    HeaderCollection headers;
    headers.add("A", "1");
    headers.add("B", "2");
    const HeaderCollection& view = headers;

    std::string seen;
    view.for_each([&](const HeaderField& field) { seen += field.name() + field.value(); });
    EXPECT_EQ(seen, "A1B2");
}

TEST(HeaderCollectionTest, ClearRemovesAll) {
    HeaderCollection headers;
    headers.add("A", "1");
    headers.clear();
    EXPECT_TRUE(headers.empty());
    EXPECT_EQ(headers.size(), 0u);
}
