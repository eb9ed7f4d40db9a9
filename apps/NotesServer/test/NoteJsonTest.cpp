#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "service/NoteJson.h"

// 输出字段顺序固定为 id、title、content
TEST(NoteJsonTest, SerializeNoteKeepsFieldOrder) {
    Note n;
    n.id = NoteId(1);
    n.title = "Lorem Ipsum";
    n.content = "";
    EXPECT_EQ(notejson::to_json(n), "{\"id\":1,\"title\":\"Lorem Ipsum\",\"content\":\"\"}");
}

TEST(NoteJsonTest, SerializeListAndEscapes) {
    std::vector<Note> notes;
    EXPECT_EQ(notejson::to_json(notes), "[]");

    Note n;
    n.id = NoteId(2);
    n.title = "a\"b";
    n.content = "line\n";
    notes.push_back(n);
    EXPECT_EQ(notejson::to_json(notes), "[{\"id\":2,\"title\":\"a\\\"b\",\"content\":\"line\\n\"}]");
}

TEST(NoteJsonTest, ParseCreateRequest) {
    notejson::CreateRequest req;
    std::string error;

    ASSERT_TRUE(notejson::parse_create_request("{\"title\":\"t\"}", req, error));
    EXPECT_EQ(req.title, "t");
    EXPECT_EQ(req.content, "");

    ASSERT_TRUE(notejson::parse_create_request("{\"title\":\"\",\"content\":\"c\",\"extra\":1}", req, error));
    EXPECT_EQ(req.title, "");
    EXPECT_EQ(req.content, "c");

    // null content 视为缺失
    ASSERT_TRUE(notejson::parse_create_request("{\"title\":\"t\",\"content\":null}", req, error));
    EXPECT_EQ(req.content, "");
}

TEST(NoteJsonTest, ParseCreateRequestRejectsBadShape) {
    notejson::CreateRequest req;
    std::string error;

    EXPECT_FALSE(notejson::parse_create_request("", req, error));
    EXPECT_FALSE(notejson::parse_create_request("not json", req, error));
    EXPECT_FALSE(notejson::parse_create_request("[1,2]", req, error));
    EXPECT_FALSE(notejson::parse_create_request("{}", req, error));
    EXPECT_FALSE(notejson::parse_create_request("{\"title\":null}", req, error));
    EXPECT_FALSE(notejson::parse_create_request("{\"title\":5}", req, error));
    EXPECT_FALSE(notejson::parse_create_request("{\"title\":\"t\",\"content\":false}", req, error));
    EXPECT_FALSE(error.empty());
}

// 字段是否存在与值是否为空是两回事
TEST(NoteJsonTest, ParseUpdateRequestTracksPresence) {
    NotePatch patch;
    std::string error;

    ASSERT_TRUE(notejson::parse_update_request("{}", patch, error));
    EXPECT_TRUE(patch.empty());

    ASSERT_TRUE(notejson::parse_update_request("{\"title\":null,\"content\":null}", patch, error));
    EXPECT_TRUE(patch.empty());

    ASSERT_TRUE(notejson::parse_update_request("{\"content\":\"\"}", patch, error));
    EXPECT_FALSE(patch.hasTitle);
    EXPECT_TRUE(patch.hasContent);
    EXPECT_EQ(patch.content, "");

    ASSERT_TRUE(notejson::parse_update_request("{\"title\":\"x\",\"content\":\"y\"}", patch, error));
    EXPECT_TRUE(patch.hasTitle);
    EXPECT_EQ(patch.title, "x");
    EXPECT_TRUE(patch.hasContent);
    EXPECT_EQ(patch.content, "y");
}

TEST(NoteJsonTest, ParseUpdateRequestRejectsBadShape) {
    NotePatch patch;
    std::string error;

    EXPECT_FALSE(notejson::parse_update_request("{", patch, error));
    EXPECT_FALSE(notejson::parse_update_request("\"title\"", patch, error));
    EXPECT_FALSE(notejson::parse_update_request("{\"title\":[]}", patch, error));
    EXPECT_FALSE(notejson::parse_update_request("{\"content\":{}}", patch, error));
}
