#include <gtest/gtest.h>
#include "http/HttpUtils.hpp"

using namespace chunkd::http;

TEST(HttpUtils, UrlDecode) {
    EXPECT_EQ(urlDecode("doc%20name.txt"), "doc name.txt");
    EXPECT_EQ(urlDecode("a+b"), "a b");
    EXPECT_EQ(urlDecode("%2e%2E%2f"), "../");
    EXPECT_EQ(urlDecode("100%"), "100%");
    EXPECT_EQ(urlDecode("%zz"), "%zz");
}

TEST(HttpUtils, ParseUrlEncoded) {
    auto m = parseUrlEncoded("file_name=my%20doc.txt&total_chunks=3&&flag");
    EXPECT_EQ(m.at("file_name"), "my doc.txt");
    EXPECT_EQ(m.at("total_chunks"), "3");
    EXPECT_EQ(m.at("flag"), "");
    EXPECT_EQ(m.size(), 3u);
}

TEST(HttpUtils, SplitTarget) {
    std::string path;
    std::unordered_map<std::string, std::string> query;

    splitTarget("/merge-chunk?file_name=a.bin&total_chunks=2", path, query);
    EXPECT_EQ(path, "/merge-chunk");
    EXPECT_EQ(query.at("file_name"), "a.bin");
    EXPECT_EQ(query.at("total_chunks"), "2");

    splitTarget("/", path, query);
    EXPECT_EQ(path, "/");
    EXPECT_TRUE(query.empty());
}

TEST(HttpUtils, ParseInteger) {
    long long v = 0;
    EXPECT_TRUE(parseInteger("42", v));
    EXPECT_EQ(v, 42);
    EXPECT_TRUE(parseInteger(" -7 ", v));
    EXPECT_EQ(v, -7);
    EXPECT_FALSE(parseInteger("", v));
    EXPECT_FALSE(parseInteger("-", v));
    EXPECT_FALSE(parseInteger("12abc", v));
    EXPECT_FALSE(parseInteger("1.5", v));
    EXPECT_FALSE(parseInteger("99999999999999999999999", v));
}

TEST(HttpUtils, HeaderParams) {
    auto p = parseHeaderParams("form-data; name=\"file\"; filename=\"a;b.txt\"");
    EXPECT_EQ(p.at("name"), "file");
    // Quoted semicolons are not supported, the value is cut at ';'
    EXPECT_EQ(p.count("filename"), 1u);
}
