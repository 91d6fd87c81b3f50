#include <gtest/gtest.h>
#include "socialxml/validate.hpp"
#include "socialxml/diagnostics_json.hpp"
#include "test_env.hpp"
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

using namespace socialxml;

TEST(Validate, EmptyDocument){
    for(const char* doc : {"", "   \n\t  \n"}){
        auto r = validate(doc);
        EXPECT_FALSE(r.is_valid);
        ASSERT_EQ(r.error_count, 1u);
        ASSERT_EQ(r.errors.size(), 1u);
        EXPECT_EQ(r.errors[0].line, 0);
        EXPECT_EQ(r.errors[0].kind, ErrorKind::structure);
        EXPECT_EQ(r.errors[0].description, "No XML content to validate");
    }
}

TEST(Validate, SingleUserIsValid){
    auto r = validate("<user><id>1</id><name>Ali</name></user>");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.error_count, 0u);
    EXPECT_TRUE(r.errors.empty());
}

TEST(Validate, DuplicateIdsOnOneLine){
    auto r = validate("<users><user><id>1</id><name>Ali</name></user><user><id>1</id><name>Omar</name></user></users>");
    EXPECT_FALSE(r.is_valid);
    ASSERT_EQ(r.error_count, 1u);
    EXPECT_NE(r.errors[0].description.find("Duplicate user ID '1'"), std::string::npos);
}

TEST(Validate, DanglingFollower){
    auto r = validate("<users><user><id>1</id><name>Ali</name><followers><follower><id>3</id></follower></followers></user>"
                      "<user><id>2</id><name>Omar</name></user></users>");
    ASSERT_EQ(r.error_count, 1u);
    const auto& d = r.errors[0].description;
    EXPECT_NE(d.find("Invalid follower reference"), std::string::npos);
    EXPECT_NE(d.find('3'), std::string::npos);
}

TEST(Validate, UnmatchedClosingTag){
    auto r = validate("<users>\n  <user><id>1</id><name>Ali</name></user>\n</users>\n</user>");
    ASSERT_EQ(r.error_count, 1u);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::structure);
    EXPECT_EQ(r.errors[0].line, 4);
    EXPECT_NE(r.errors[0].description.find("user"), std::string::npos);
}

TEST(Validate, ErrorsSortedByLine){
    auto r = validate(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<users>\n"
        "  <user>\n"
        "    <id>1</id>\n"
        "    <name>Alice</name>\n"
        "    <posts>\n"
        "      <post>\n"
        "        <body>Hello</body>\n"
        "        <topics>\n"
        "          <topic>test</topic>\n"
        "        </topics>\n"
        "      </post>\n"
        "  </user>\n"
        "</users>");
    ASSERT_EQ(r.error_count, 3u);
    EXPECT_EQ(r.errors[0].line, 2);
    EXPECT_EQ(r.errors[1].line, 13);
    EXPECT_EQ(r.errors[2].line, 14);
    for(size_t i = 1; i < r.errors.size(); ++i) EXPECT_LE(r.errors[i - 1].line, r.errors[i].line);
}

TEST(Validate, UserWithIdAttributeAndMatchingChild){
    auto r = validate("<users>\n<user id=\"1\">\n<id>1</id>\n<name>Ali</name>\n</user>\n</users>");
    EXPECT_TRUE(r.is_valid);
    EXPECT_EQ(r.error_count, 0u);
}

TEST(Validate, UserWithoutName){
    auto r = validate("<users>\n<user>\n<id>1</id>\n</user>\n</users>");
    ASSERT_EQ(r.error_count, 1u);
    EXPECT_EQ(r.errors[0].line, 2);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::semantic);
    EXPECT_EQ(r.errors[0].description, "Missing user name");
}

TEST(Validate, StructureBeforeSemanticOnSameLine){
    auto r = validate("<users>\n<user><id></id></users>\n</user>");
    ASSERT_GE(r.errors.size(), 2u);
    EXPECT_EQ(r.errors[0].line, 2);
    EXPECT_EQ(r.errors[0].kind, ErrorKind::structure);
    EXPECT_EQ(r.errors[1].line, 2);
    EXPECT_EQ(r.errors[1].kind, ErrorKind::semantic);
    EXPECT_EQ(r.errors[1].description, "Empty user ID");
}

TEST(Validate, CollectsEverythingInsteadOfFailingFast){
    auto r = validate(
        "<users>\n"
        "  <user>\n"
        "    <id>1</id>\n"
        "    <name></name>\n"
        "    <posts\n"
        "  </user>\n"
        "  <user><id>1</id></user>\n"
        "</users>\n"
        "</extra>");
    EXPECT_FALSE(r.is_valid);
    EXPECT_EQ(r.error_count, r.errors.size());
    std::vector<ErrorKind> kinds;
    for(const auto& e : r.errors) kinds.push_back(e.kind);
    EXPECT_NE(std::find(kinds.begin(), kinds.end(), ErrorKind::syntax), kinds.end());
    EXPECT_NE(std::find(kinds.begin(), kinds.end(), ErrorKind::structure), kinds.end());
    EXPECT_NE(std::find(kinds.begin(), kinds.end(), ErrorKind::semantic), kinds.end());
}

TEST(Validate, IndependentDocumentsInParallel){
    const std::string good = "<users><user><id>1</id><name>A</name></user></users>";
    const std::string bad = "<users><user><id>1</id><name>A</name></user><user><id>1</id><name>B</name></user></users>";
    std::vector<int> error_counts(8, -1);
    std::vector<std::thread> workers;
    for(int i = 0; i < 8; ++i)
        workers.emplace_back([&, i]{
            int total = 0;
            for(int k = 0; k < 50; ++k) total += static_cast<int>(validate(i % 2 ? bad : good).error_count);
            error_counts[i] = total;
        });
    for(auto& t : workers) t.join();
    for(int i = 0; i < 8; ++i) EXPECT_EQ(error_counts[i], i % 2 ? 50 : 0);
}

TEST(DiagnosticsJson, EmptyDocument){
    EXPECT_EQ(diagnostics_to_json(validate("")),
              "{\"is_valid\":false,\"error_count\":1,\"errors\":[{\"line\":0,"
              "\"description\":\"No XML content to validate\",\"type\":\"structure\"}]}");
}

TEST(DiagnosticsJson, ValidDocument){
    EXPECT_EQ(diagnostics_to_json(validate("<user><id>1</id><name>Ali</name></user>")),
              "{\"is_valid\":true,\"error_count\":0,\"errors\":[]}");
}

TEST(DiagnosticsJson, EscapesDescriptions){
    auto r = validate("<a>\n</b x=\"1\">\n</a>");
    auto js = diagnostics_to_json(r);
    EXPECT_NE(js.find("Malformed tag '</b x=\\\"1\\\">'"), std::string::npos) << js;
    EXPECT_NE(js.find("\"type\":\"syntax\""), std::string::npos) << js;
}

TEST(DiagnosticsJson, JsonEscape){
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(json_escape(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(DiagnosticsJson, EchoedOnStderrWhenEnabled){
    ScopedEnv on("SOCIALXML_DIAG_JSON", "1");
    ::testing::internal::CaptureStderr();
    (void)validate("");
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("\"No XML content to validate\""), std::string::npos);
}

TEST(DiagnosticsJson, SilentByDefault){
    ScopedEnv off("SOCIALXML_DIAG_JSON", "");
    ScopedEnv quiet("SOCIALXML_TRACE", "");
    ::testing::internal::CaptureStderr();
    (void)validate("<a></a>");
    EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
}
