#include "relay/network/upload_receiver.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <string>

using json = nlohmann::json;
using relay::network::HttpMethod;
using relay::network::HttpRequest;
using relay::network::HttpResponse;
using relay::network::ResumableUploadReceiver;
using relay::network::kCloseWithoutResponse;

namespace {

constexpr const char* kUploadUrl = "/upload/drive/v3/files?uploadType=resumable";

HttpRequest make_request(HttpMethod method, const std::string& url, const std::string& body = "") {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.set_header("Host", "127.0.0.1:8080");
    request.body.assign(body.begin(), body.end());
    return request;
}

std::string session_url(const HttpResponse& response) {
    const std::string location = response.get_header("Location");
    const auto path = location.find("/upload/");
    return path == std::string::npos ? "" : location.substr(path);
}

HttpRequest put_chunk(const std::string& url, const std::string& range, const std::string& body) {
    auto request = make_request(HttpMethod::PUT, url, body);
    request.set_header("Content-Range", range);
    return request;
}

class UploadReceiverTest : public ::testing::Test {
protected:
    UploadReceiverTest() : receiver_(io_context_, 0) {}

    std::string open(const std::string& name, std::uint64_t total, bool with_link = false) {
        std::string url = kUploadUrl;
        if (with_link) {
            url += "&fields=id,name,mimeType,size,webViewLink";
        }
        auto request = make_request(HttpMethod::POST, url, json{{"name", name}, {"mimeType", "text/plain"}}.dump());
        request.set_header("X-Upload-Content-Length", std::to_string(total));
        auto response = receiver_.handle(request);
        EXPECT_EQ(response.status_code, 200);
        return session_url(response);
    }

    boost::asio::io_context io_context_;
    ResumableUploadReceiver receiver_;
};

} // namespace

TEST_F(UploadReceiverTest, ChunkedUploadCompletesWithObjectMetadata) {
    const auto url = open("notes.txt", 10, true);
    ASSERT_FALSE(url.empty());
    EXPECT_NE(url.find("upload_id="), std::string::npos);

    auto partial = receiver_.handle(put_chunk(url, "bytes 0-3/10", "0123"));
    EXPECT_EQ(partial.status_code, 308);
    EXPECT_EQ(partial.get_header("Range"), "bytes=0-3");

    auto done = receiver_.handle(put_chunk(url, "bytes 4-9/10", "456789"));
    ASSERT_EQ(done.status_code, 200);

    auto body = json::parse(done.body_as_string());
    EXPECT_EQ(body["name"], "notes.txt");
    EXPECT_EQ(body["mimeType"], "text/plain");
    EXPECT_EQ(body["size"], "10");
    const std::string id = body["id"];
    EXPECT_EQ(body["webViewLink"], "https://drive.local/file/d/" + id + "/view");

    auto stored = receiver_.content(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(std::string(stored->begin(), stored->end()), "0123456789");
}

TEST_F(UploadReceiverTest, LinkOmittedUnlessRequested) {
    const auto url = open("a.bin", 1);
    auto done = receiver_.handle(put_chunk(url, "bytes 0-0/1", "a"));
    ASSERT_EQ(done.status_code, 200);
    EXPECT_FALSE(json::parse(done.body_as_string()).contains("webViewLink"));
}

TEST_F(UploadReceiverTest, StatusQueryReportsPersistedRange) {
    const auto url = open("a.bin", 10);

    auto empty = receiver_.handle(put_chunk(url, "bytes */10", ""));
    EXPECT_EQ(empty.status_code, 308);
    EXPECT_TRUE(empty.get_header("Range").empty());

    ASSERT_EQ(receiver_.handle(put_chunk(url, "bytes 0-4/10", "abcde")).status_code, 308);
    auto status = receiver_.handle(put_chunk(url, "bytes */10", ""));
    EXPECT_EQ(status.get_header("Range"), "bytes=0-4");
}

TEST_F(UploadReceiverTest, OverlappingResendIsNotDuplicated) {
    const auto url = open("a.bin", 6);
    ASSERT_EQ(receiver_.handle(put_chunk(url, "bytes 0-3/6", "abcd")).status_code, 308);

    auto done = receiver_.handle(put_chunk(url, "bytes 2-5/6", "cdef"));
    ASSERT_EQ(done.status_code, 200);
    const std::string id = json::parse(done.body_as_string())["id"];
    auto stored = receiver_.content(id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(std::string(stored->begin(), stored->end()), "abcdef");
}

TEST_F(UploadReceiverTest, ZeroByteUploadCompletesOnEmptyPut) {
    const auto url = open("empty.txt", 0);
    auto done = receiver_.handle(put_chunk(url, "bytes */0", ""));
    ASSERT_EQ(done.status_code, 200);
    EXPECT_EQ(json::parse(done.body_as_string())["size"], "0");
}

TEST_F(UploadReceiverTest, RejectsGapsAndBadRanges) {
    const auto url = open("a.bin", 10);

    EXPECT_EQ(receiver_.handle(put_chunk(url, "bytes 5-9/10", "56789")).status_code, 400);
    EXPECT_EQ(receiver_.handle(put_chunk(url, "bytes 0-4/10", "abc")).status_code, 400);
    EXPECT_EQ(receiver_.handle(put_chunk(url, "bytes 0-4/11", "abcde")).status_code, 400);
    EXPECT_EQ(receiver_.handle(put_chunk(url, "bytes 4-0/10", "")).status_code, 400);
    EXPECT_EQ(receiver_.handle(put_chunk(url, "items 0-4/10", "abcde")).status_code, 400);
    EXPECT_EQ(receiver_.handle(put_chunk(
        "/upload/drive/v3/files?uploadType=resumable&upload_id=nope", "bytes 0-0/1", "a")).status_code, 404);
}

TEST_F(UploadReceiverTest, InjectedStatusCarriesReason) {
    const auto url = open("a.bin", 3);
    receiver_.inject_put_fault({ResumableUploadReceiver::PutFault::Kind::Status, 403, "rateLimitExceeded", 0});

    auto limited = receiver_.handle(put_chunk(url, "bytes 0-2/3", "abc"));
    EXPECT_EQ(limited.status_code, 403);
    auto body = json::parse(limited.body_as_string());
    EXPECT_EQ(body["error"]["errors"][0]["reason"], "rateLimitExceeded");

    EXPECT_EQ(receiver_.handle(put_chunk(url, "bytes 0-2/3", "abc")).status_code, 200);
}

TEST_F(UploadReceiverTest, DroppedResponseStillStoresBytes) {
    const auto url = open("a.bin", 8);
    receiver_.inject_put_fault({ResumableUploadReceiver::PutFault::Kind::DropResponse, 0, "", 0});

    auto dropped = receiver_.handle(put_chunk(url, "bytes 0-3/8", "abcd"));
    EXPECT_EQ(dropped.status_code, kCloseWithoutResponse);

    auto status = receiver_.handle(put_chunk(url, "bytes */8", ""));
    EXPECT_EQ(status.get_header("Range"), "bytes=0-3");
}

TEST_F(UploadReceiverTest, PartialAcceptKeepsPrefix) {
    const auto url = open("a.bin", 8);
    receiver_.inject_put_fault({ResumableUploadReceiver::PutFault::Kind::PartialAccept, 0, "", 2});

    auto partial = receiver_.handle(put_chunk(url, "bytes 0-7/8", "abcdefgh"));
    EXPECT_EQ(partial.status_code, 308);
    EXPECT_EQ(partial.get_header("Range"), "bytes=0-1");
}

TEST_F(UploadReceiverTest, PermissionsAndFileLookup) {
    const auto url = open("a.bin", 1);
    auto done = receiver_.handle(put_chunk(url, "bytes 0-0/1", "a"));
    const std::string id = json::parse(done.body_as_string())["id"];

    EXPECT_FALSE(receiver_.is_published(id));
    auto permission = receiver_.handle(make_request(HttpMethod::POST, "/drive/v3/files/" + id + "/permissions",
                                                    R"({"role":"reader","type":"anyone"})"));
    EXPECT_EQ(permission.status_code, 200);
    EXPECT_TRUE(receiver_.is_published(id));

    auto file = receiver_.handle(make_request(HttpMethod::GET, "/drive/v3/files/" + id + "?fields=id,webViewLink"));
    ASSERT_EQ(file.status_code, 200);
    EXPECT_EQ(json::parse(file.body_as_string())["webViewLink"], "https://drive.local/file/d/" + id + "/view");

    EXPECT_EQ(receiver_.handle(make_request(HttpMethod::GET, "/drive/v3/files/missing")).status_code, 404);
    EXPECT_EQ(receiver_.handle(make_request(HttpMethod::GET, "/elsewhere")).status_code, 404);
}

TEST_F(UploadReceiverTest, NonStringMetadataIsRejected) {
    auto response = receiver_.handle(make_request(HttpMethod::POST, kUploadUrl, R"({"name":7})"));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(receiver_.session_count(), 0u);
}

TEST(UploadReceiverAuthTest, RequiresBearerTokenWhenConfigured) {
    boost::asio::io_context io_context;
    ResumableUploadReceiver::Options options;
    options.access_token = "secret";
    ResumableUploadReceiver receiver(io_context, 0, options);

    auto request = make_request(HttpMethod::POST, kUploadUrl, "{}");
    EXPECT_EQ(receiver.handle(request).status_code, 401);

    request.set_header("Authorization", "Bearer secret");
    EXPECT_EQ(receiver.handle(request).status_code, 200);
    EXPECT_EQ(receiver.session_count(), 1u);
}

TEST(UploadReceiverAuthTest, NonResumableUploadIsRejected) {
    boost::asio::io_context io_context;
    ResumableUploadReceiver receiver(io_context, 0);
    EXPECT_EQ(receiver.handle(make_request(HttpMethod::POST, "/upload/drive/v3/files?uploadType=media")).status_code,
              400);
}
