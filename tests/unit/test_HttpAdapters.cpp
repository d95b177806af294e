#include <gtest/gtest.h>
#include "LoopbackHttpServer.hpp"
#include "fakes.hpp"
#include "index/TaskclusterIndex.hpp"
#include "storage/TaskclusterQueue.hpp"
#include "taskcluster/Client.hpp"
#include "transfer/CurlTransferer.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace vc;
using namespace vc::test;

namespace {

taskcluster::Client unsignedClient(const LoopbackHttpServer& server) {
    return {server.url(), taskcluster::Credentials{}};
}

}

class TaskclusterIndexHttpTest : public ::testing::Test {
protected:
    LoopbackHttpServer server;
    index::TaskclusterIndex tcIndex{unsignedClient(server)};
    const std::string ns = "tc-vcs.v1.clones.0123abcd";
};

TEST_F(TaskclusterIndexHttpTest, NotFoundIsAMiss) {
    server.respond(404, R"({"code":"ResourceNotFound"})");
    EXPECT_FALSE(tcIndex.find(ns).has_value());

    const auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "GET");
    EXPECT_EQ(reqs[0].target, "/api/index/v1/task/tc-vcs.v1.clones.0123abcd");
    EXPECT_EQ(reqs[0].header("accept"), "application/json");
    EXPECT_TRUE(reqs[0].header("authorization").empty());
}

TEST_F(TaskclusterIndexHttpTest, ServerErrorRaisesUpstreamError) {
    server.respond(500, R"({"code":"InternalServerError"})");
    try {
        (void)tcIndex.find(ns);
        FAIL() << "a 500 must not read as a miss";
    } catch (const UpstreamError& e) {
        EXPECT_EQ(e.status(), 500);
        EXPECT_NE(e.body().find("InternalServerError"), std::string::npos);
    }
}

TEST_F(TaskclusterIndexHttpTest, ForbiddenRaisesUpstreamError) {
    server.respond(403, R"({"code":"InsufficientScopes"})");
    EXPECT_THROW((void)tcIndex.find(ns), UpstreamError);
}

TEST_F(TaskclusterIndexHttpTest, HitReturnsTheRecord) {
    server.respond(200, nlohmann::json{
        {"namespace", ns},
        {"taskId", "fGQ6SPJeTaiEqlsBMsrVfw"},
        {"rank", 1700000000123},
        {"data", nlohmann::json::object()},
        {"expires", "2030-01-01T00:00:00.000Z"}
    }.dump());

    const auto record = tcIndex.find(ns);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->ns, ns);
    EXPECT_EQ(record->taskId, "fGQ6SPJeTaiEqlsBMsrVfw");
    EXPECT_EQ(record->rank, 1700000000123);
    EXPECT_EQ(util::toIso8601(record->expires), "2030-01-01T00:00:00.000Z");
}

TEST_F(TaskclusterIndexHttpTest, MalformedBodyRaisesUpstreamError) {
    server.respond(200, "<html>proxy error</html>", "text/html");
    EXPECT_THROW((void)tcIndex.find(ns), UpstreamError);
}

TEST_F(TaskclusterIndexHttpTest, InsertPutsTheRecord) {
    server.respond(200, "{}");
    tcIndex.insert(ns, {ns, "taskA", 42, util::parseIso8601("2030-01-01T00:00:00.000Z"), nlohmann::json::object()});

    const auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].method, "PUT");
    EXPECT_EQ(reqs[0].target, "/api/index/v1/task/tc-vcs.v1.clones.0123abcd");
    EXPECT_EQ(reqs[0].header("content-type"), "application/json");

    const auto body = nlohmann::json::parse(reqs[0].body);
    EXPECT_EQ(body["taskId"], "taskA");
    EXPECT_EQ(body["rank"], 42);
    EXPECT_EQ(body["expires"], "2030-01-01T00:00:00.000Z");
}

TEST_F(TaskclusterIndexHttpTest, RejectedInsertRaisesUpstreamError) {
    server.respond(409, R"({"code":"RequestConflict"})");
    EXPECT_THROW(tcIndex.insert(ns, {ns, "taskA", 1, util::Clock::now(), {}}), UpstreamError);
}

TEST(TaskclusterClientHttpTest, SignedRequestsCarryHawk) {
    LoopbackHttpServer server;
    server.respond(404);
    const index::TaskclusterIndex signedIndex{taskcluster::Client(server.url(), {"project/ci", "token", ""})};

    EXPECT_FALSE(signedIndex.find("a.b").has_value());
    const auto auth = server.requests().at(0).header("authorization");
    EXPECT_EQ(auth.rfind(R"(Hawk id="project/ci", ts=")", 0), 0u) << auth;
    EXPECT_NE(auth.find("mac=\""), std::string::npos);
}

TEST(TaskclusterClientHttpTest, ConnectionFailureIsAnUpstreamError) {
    std::string deadRoot;
    {
        const LoopbackHttpServer gone;
        deadRoot = gone.url();
    }
    const taskcluster::Client client{deadRoot, {}};
    try {
        (void)client.request("GET", client.serviceUrl("index") + "/task/a.b");
        FAIL() << "nothing listens there";
    } catch (const UpstreamError& e) {
        EXPECT_EQ(e.status(), 0);
    }
}

TEST(TaskclusterQueueHttpTest, CreateDestinationReturnsThePutUrl) {
    LoopbackHttpServer server;
    server.respond(200, R"({"storageType":"s3","putUrl":"https://bucket.example/blob?sig=1"})");
    storage::TaskclusterQueue queue{unsignedClient(server)};

    storage::DestinationOptions opts;
    opts.expires = util::parseIso8601("2030-01-01T00:00:00.000Z");
    const auto dest = queue.createDestination("taskA", "0", "public/foo.tar.gz", opts);
    EXPECT_EQ(dest.putUrl, "https://bucket.example/blob?sig=1");

    const auto req = server.requests().at(0);
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.target, "/api/queue/v1/task/taskA/runs/0/artifacts/public%2Ffoo.tar.gz");
    const auto body = nlohmann::json::parse(req.body);
    EXPECT_EQ(body["storageType"], "s3");
    EXPECT_EQ(body["contentType"], "application/x-tar");
    EXPECT_EQ(body["expires"], "2030-01-01T00:00:00.000Z");
}

TEST(TaskclusterQueueHttpTest, MissingPutUrlRaisesUpstreamError) {
    LoopbackHttpServer server;
    server.respond(200, R"({"storageType":"s3"})");
    storage::TaskclusterQueue queue{unsignedClient(server)};
    EXPECT_THROW((void)queue.createDestination("taskA", "0", "public/foo.tar.gz", {}), UpstreamError);
}

class CurlTransfererHttpTest : public ::testing::Test {
protected:
    LoopbackHttpServer server;
    TempDir tmp{"curl"};
    transfer::CurlTransferer curl;
};

TEST_F(CurlTransfererHttpTest, DownloadWritesTheBody) {
    server.respond(200, "tarball bytes", "application/x-tar");
    curl.download(server.url("/blob"), tmp / "out.tar.gz");

    EXPECT_EQ(readTextFile(tmp / "out.tar.gz"), "tarball bytes");
    EXPECT_EQ(server.requests().at(0).method, "GET");
    EXPECT_EQ(server.requests().at(0).target, "/blob");
}

TEST_F(CurlTransfererHttpTest, ServerErrorIsTransientAndLeavesNoPartialFile) {
    server.respond(503, "try later", "text/plain");
    try {
        curl.download(server.url("/blob"), tmp / "out.tar.gz");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.transient());
        EXPECT_EQ(e.httpStatus(), 503);
    }
    EXPECT_FALSE(fs::exists(tmp / "out.tar.gz"));
}

TEST_F(CurlTransfererHttpTest, ClientErrorIsPermanent) {
    server.respond(403, "denied", "text/plain");
    try {
        curl.download(server.url("/blob"), tmp / "out.tar.gz");
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_FALSE(e.transient());
        EXPECT_EQ(e.httpStatus(), 403);
    }
    EXPECT_FALSE(fs::exists(tmp / "out.tar.gz"));
}

TEST_F(CurlTransfererHttpTest, UploadPutsTheFileWithTarHeaders) {
    writeTextFile(tmp / "in.tar.gz", "compressed snapshot");
    server.respond(200, "", "text/plain");

    curl.upload(tmp / "in.tar.gz", server.url("/bucket/blob?sig=1"));

    const auto req = server.requests().at(0);
    EXPECT_EQ(req.method, "PUT");
    EXPECT_EQ(req.target, "/bucket/blob?sig=1");
    EXPECT_EQ(req.header("content-type"), "application/x-tar");
    EXPECT_EQ(req.header("content-encoding"), "gzip");
    EXPECT_EQ(req.header("content-length"), "19");
    EXPECT_EQ(req.body, "compressed snapshot");
}

TEST_F(CurlTransfererHttpTest, RejectedUploadIsPermanent) {
    writeTextFile(tmp / "in.tar.gz", "compressed snapshot");
    server.respond(403, "<Error>SignatureDoesNotMatch</Error>", "application/xml");
    try {
        curl.upload(tmp / "in.tar.gz", server.url("/bucket/blob"));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_FALSE(e.transient());
        EXPECT_EQ(e.httpStatus(), 403);
        EXPECT_NE(std::string(e.what()).find("SignatureDoesNotMatch"), std::string::npos);
    }
}

TEST_F(CurlTransfererHttpTest, UnavailableUploadIsTransient) {
    writeTextFile(tmp / "in.tar.gz", "compressed snapshot");
    server.respond(503, "", "text/plain");
    try {
        curl.upload(tmp / "in.tar.gz", server.url("/bucket/blob"));
        FAIL() << "expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_TRUE(e.transient());
    }
}
