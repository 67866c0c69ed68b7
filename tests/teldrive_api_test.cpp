#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include "api/teldrive_api.hpp"
#include "errors/errors.hpp"
#include "fakes.hpp"

using namespace teldrive;
using teldrive::test::FakeTransport;

class TelDriveApiTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        transport = std::make_shared<FakeTransport>();
        ApiSettings settings;
        settings.apiHost = "https://drive.example.com/";
        settings.accessToken = "secret";
        api = std::make_unique<TelDriveApi>(settings, transport);
    }

    PartUpload partRequest(int partNo)
    {
        PartUpload p;
        p.uploadId = "session123";
        p.partName = "movie.mkv.part.00" + std::to_string(partNo);
        p.fileName = "movie.mkv";
        p.partNo = partNo;
        p.channelId = -100555;
        p.encrypted = true;
        return p;
    }

    std::shared_ptr<FakeTransport> transport;
    std::unique_ptr<TelDriveApi> api;
};

TEST_F(TelDriveApiTest, InitializeStoresUserIdAndSendsCookie)
{
    transport->reply(200, R"({"userName":"alice","userId":4242,"hash":"h"})");
    Session s = api->initialize();
    EXPECT_EQ(s.userName, "alice");
    EXPECT_EQ(api->userId(), 4242);

    const HttpRequest &req = transport->last();
    EXPECT_EQ(req.method, "GET");
    EXPECT_EQ(req.url, "https://drive.example.com/api/auth/session");
    EXPECT_TRUE(test::hasHeader(req, "Cookie: access_token=secret"));
    EXPECT_TRUE(test::hasHeader(req, std::string("User-Agent: ") + DEFAULT_USER_AGENT));
}

TEST_F(TelDriveApiTest, InitializeFailsOnRejectedSession)
{
    transport->reply(401, R"({"message":"unauthorized"})");
    EXPECT_THROW(api->initialize(), ApiError);
    transport->fail("could not resolve host");
    EXPECT_THROW(api->initialize(), ApiError);
}

TEST_F(TelDriveApiTest, ExistingPartsKeyedByPartNo)
{
    transport->reply(200, R"([{"partId":11,"partNo":1,"size":10,"salt":""},
                              {"partId":13,"partNo":3,"size":4,"salt":"z"}])");
    auto parts = api->listExistingParts("session123", nullptr);
    EXPECT_EQ(transport->last().url, "https://drive.example.com/api/uploads/session123");
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts.at(1).partId, 11);
    EXPECT_EQ(parts.at(3).salt, "z");
}

TEST_F(TelDriveApiTest, ExistingPartsLookupFailuresMeanNoParts)
{
    transport->reply(404, R"({"message":"not found"})");
    EXPECT_TRUE(api->listExistingParts("s", nullptr).empty());

    transport->reply(500, "oops");
    EXPECT_TRUE(api->listExistingParts("s", nullptr).empty());

    transport->fail("connection reset");
    EXPECT_TRUE(api->listExistingParts("s", nullptr).empty());

    transport->reply(200, "not json");
    EXPECT_TRUE(api->listExistingParts("s", nullptr).empty());
}

TEST_F(TelDriveApiTest, ExistingPartsLookupHonoursCancellation)
{
    transport->fail("aborted", true);
    EXPECT_THROW(api->listExistingParts("s", nullptr), UploadCancelled);
}

TEST_F(TelDriveApiTest, UploadPartSendsQueryAndBody)
{
    transport->reply(200, R"({"partId":77,"partNo":2,"size":5,"salt":"pepper"})");
    std::istringstream in("hello world");
    SourceStream source(in);
    BoundedReader body(source, 5);

    RemotePart part = api->uploadPart(partRequest(2), body, nullptr);
    EXPECT_EQ(part.partId, 77);
    EXPECT_EQ(part.salt, "pepper");

    const auto &rec = transport->requests.back();
    EXPECT_EQ(rec.request.method, "POST");
    EXPECT_EQ(rec.request.url, "https://drive.example.com/api/uploads/session123");
    EXPECT_EQ(test::queryValue(rec.request, "partName"), "movie.mkv.part.002");
    EXPECT_EQ(test::queryValue(rec.request, "fileName"), "movie.mkv");
    EXPECT_EQ(test::queryValue(rec.request, "partNo"), "2");
    EXPECT_EQ(test::queryValue(rec.request, "channelId"), "-100555");
    EXPECT_EQ(test::queryValue(rec.request, "encrypted"), "true");
    EXPECT_TRUE(test::hasHeader(rec.request, "Content-Type: application/octet-stream"));
    EXPECT_EQ(rec.body, "hello");
    EXPECT_EQ(source.consumed(), 5u);
}

TEST_F(TelDriveApiTest, UploadPartUsesUploadHostWhenSet)
{
    ApiSettings settings;
    settings.apiHost = "https://drive.example.com";
    settings.uploadHost = "https://upload.example.com/";
    settings.accessToken = "secret";
    TelDriveApi uploadApi(settings, transport);

    transport->reply(200, R"({"partId":1,"partNo":1})");
    std::istringstream in("x");
    SourceStream source(in);
    BoundedReader body(source, 1);
    uploadApi.uploadPart(partRequest(1), body, nullptr);
    EXPECT_EQ(transport->last().url, "https://upload.example.com/api/uploads/session123");
}

TEST_F(TelDriveApiTest, UploadPartFailuresCarryPartNumber)
{
    std::istringstream in(std::string(64, 'a'));
    SourceStream source(in);

    transport->reply(500, "boom");
    BoundedReader first(source, 8);
    try
    {
        api->uploadPart(partRequest(2), first, nullptr);
        FAIL() << "expected ChunkTransferError";
    }
    catch (const ChunkTransferError &e)
    {
        EXPECT_EQ(e.partNo(), 2);
        EXPECT_NE(std::string(e.what()).find("500"), std::string::npos);
    }

    transport->fail("connection reset");
    BoundedReader second(source, 8);
    EXPECT_THROW(api->uploadPart(partRequest(3), second, nullptr), ChunkTransferError);

    transport->reply(200, "<html>");
    BoundedReader third(source, 8);
    EXPECT_THROW(api->uploadPart(partRequest(4), third, nullptr), ChunkTransferError);

    transport->fail("aborted", true);
    BoundedReader fourth(source, 8);
    EXPECT_THROW(api->uploadPart(partRequest(5), fourth, nullptr), UploadCancelled);
}

TEST_F(TelDriveApiTest, CreateFilePostsManifest)
{
    transport->reply(200, R"({"id":"file-9","parentId":"dir-1","updatedAt":"2024-05-01T10:20:30Z"})");
    CreateFileRequest req;
    req.name = "movie.mkv";
    req.path = "/videos/movie.mkv";
    req.size = 15;
    req.channelId = 5;
    FilePart p;
    p.id = 77;
    req.parts.push_back(p);

    FileInfo info = api->createFile(req, nullptr);
    EXPECT_EQ(info.id, "file-9");
    EXPECT_EQ(info.parentId, "dir-1");

    const HttpRequest &sent = transport->last();
    EXPECT_EQ(sent.method, "POST");
    EXPECT_EQ(sent.url, "https://drive.example.com/api/files");
    json body = json::parse(sent.body);
    EXPECT_EQ(body["name"], "movie.mkv");
    EXPECT_EQ(body["type"], "file");
    EXPECT_EQ(body["parts"][0]["id"], 77);
}

TEST_F(TelDriveApiTest, CreateFileFailuresAreCommitErrors)
{
    CreateFileRequest req;
    req.name = "a";
    transport->reply(409, R"({"message":"exists"})");
    EXPECT_THROW(api->createFile(req, nullptr), CommitError);
    transport->reply(200, "garbage");
    EXPECT_THROW(api->createFile(req, nullptr), CommitError);
    transport->fail("timeout");
    EXPECT_THROW(api->createFile(req, nullptr), CommitError);
}

TEST_F(TelDriveApiTest, GlueCalls)
{
    transport->reply(200, R"({"items":[{"id":"1","name":"a","type":"folder"},
                                        {"id":"2","name":"b.txt","type":"file","size":3}],
                              "meta":{"count":2}})");
    auto files = api->listFiles("/docs");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[1].size, 3);
    EXPECT_EQ(test::queryValue(transport->last(), "path"), "/docs");
    EXPECT_EQ(test::queryValue(transport->last(), "limit"), "1000");

    transport->reply(200, R"({"id":"f","parentId":"p"})");
    EXPECT_EQ(api->createFolder("/docs/new").id, "f");
    EXPECT_EQ(json::parse(transport->last().body)["path"], "/docs/new");

    transport->reply(200, "{}");
    api->deleteFiles({"1", "2"});
    EXPECT_EQ(transport->last().method, "DELETE");
    EXPECT_EQ(json::parse(transport->last().body)["ids"].size(), 2u);

    transport->reply(200, "{}");
    api->renameFile("1", "renamed");
    EXPECT_EQ(transport->last().method, "PATCH");
    EXPECT_EQ(transport->last().url, "https://drive.example.com/api/files/1");

    transport->reply(200, "{}");
    api->moveFiles({"1"}, "dest");
    EXPECT_EQ(json::parse(transport->last().body)["destinationParent"], "dest");

    transport->reply(500, "fail");
    EXPECT_THROW(api->renameFile("1", "x"), ApiError);
}

TEST_F(TelDriveApiTest, DownloadUrlFromLocationHeader)
{
    transport->reply(302, "", {{"location", "https://cdn.example.com/f/1"}});
    EXPECT_EQ(api->downloadUrl("1"), "https://cdn.example.com/f/1");
    EXPECT_FALSE(transport->last().followRedirects);

    transport->reply(200, "");
    EXPECT_THROW(api->downloadUrl("1"), ApiError);

    transport->reply(404, "");
    EXPECT_THROW(api->downloadUrl("1"), ApiError);
}

TEST(UrlTest, BuildUrlEncodesQuery)
{
    EXPECT_EQ(buildUrl("http://h/x", {}), "http://h/x");
    EXPECT_EQ(buildUrl("http://h/x", {{"a", "1"}, {"name", "my file.bin"}}),
              "http://h/x?a=1&name=my%20file.bin");
    EXPECT_EQ(urlEncode("a/b&c=d"), "a%2Fb%26c%3Dd");
}
