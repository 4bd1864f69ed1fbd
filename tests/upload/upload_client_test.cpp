#include "chunkup/upload/client.hpp"

#include "chunkup/events/events.hpp"
#include "chunkup/server/mock_upload_server.hpp"
#include "support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <numeric>
#include <vector>

using namespace chunkup::upload;
using chunkup::events::ChunkSentEvent;
using chunkup::events::EventBus;
using chunkup::events::OffsetReconciledEvent;
using chunkup::events::UploadCompletedEvent;
using chunkup::events::UploadFailedEvent;
using chunkup::events::UploadStartedEvent;
using chunkup::network::HttpMethod;
using chunkup::server::MockUploadServer;
using chunkup::test::MockServerTransport;
using chunkup::test::ScriptedTransport;
using chunkup::test::make_response;

namespace {

std::vector<std::uint8_t> counting_bytes(std::size_t length) {
    std::vector<std::uint8_t> data(length);
    std::iota(data.begin(), data.end(), static_cast<std::uint8_t>(0));
    return data;
}

UploadTicket make_ticket() {
    UploadTicket ticket;
    ticket.ticket_id = "ticket-1";
    ticket.upload_link_secure = "http://upload.test/upload/ticket-1";
    ticket.complete_uri = "/uploads/ticket-1";
    ticket.free_space = 1u << 20;
    return ticket;
}

MockUploadServer::Options with_free_space(std::uint64_t free_space) {
    MockUploadServer::Options options;
    options.free_space = free_space;
    return options;
}

/**
 * Drives a 250 byte file in 100 byte chunks against the in-process mock
 * server and records every event the client publishes.
 */
class UploadClientTest : public ::testing::Test {
protected:
    UploadClientTest()
        : UploadClientTest(MockUploadServer::Options{}) {}

    explicit UploadClientTest(MockUploadServer::Options server_options)
        : server_(std::move(server_options))
        , transport_(server_)
        , client_(transport_, UploadClient::Options{server_.base_url()}, &bus_)
        , content_(counting_bytes(250))
        , source_(content_) {}

    void SetUp() override {
        bus_.subscribe<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            started_.push_back(e.ticket_id);
        });
        bus_.subscribe<ChunkSentEvent>([this](const ChunkSentEvent& e) {
            chunks_.push_back(ByteRange{e.range_start, e.range_end});
        });
        bus_.subscribe<OffsetReconciledEvent>([this](const OffsetReconciledEvent& e) {
            reconciled_.push_back(e);
        });
        bus_.subscribe<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            completed_.push_back(e.clip_uri);
        });
        bus_.subscribe<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            failed_.push_back(e);
        });
    }

    std::vector<std::uint8_t> stored(const std::string& ticket_id = "ticket-1") const {
        auto upload = server_.upload(ticket_id);
        return upload ? upload->data : std::vector<std::uint8_t>{};
    }

    std::size_t count_requests(HttpMethod method) const {
        std::size_t count = 0;
        for (const auto& request : transport_.requests) {
            if (request.method == method) {
                count++;
            }
        }
        return count;
    }

    EventBus bus_;
    MockUploadServer server_;
    MockServerTransport transport_;
    UploadClient client_;
    std::vector<std::uint8_t> content_;
    MemoryContentSource source_;

    std::vector<std::string> started_;
    std::vector<ByteRange> chunks_;
    std::vector<OffsetReconciledEvent> reconciled_;
    std::vector<std::string> completed_;
    std::vector<UploadFailedEvent> failed_;
};

class LowQuotaUploadClientTest : public UploadClientTest {
protected:
    LowQuotaUploadClientTest()
        : UploadClientTest(with_free_space(100)) {}
};

} // namespace

TEST_F(UploadClientTest, UploadsWholeFileInOrderedChunks) {
    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    EXPECT_TRUE(session.value().is_completed());
    EXPECT_EQ(session.value().bytes_written(), 250u);
    EXPECT_EQ(session.value().clip_uri(), "/videos/1000");
    EXPECT_EQ(stored(), content_);

    const std::vector<ByteRange> expected{{0, 100}, {100, 200}, {200, 250}};
    EXPECT_EQ(chunks_, expected);
    EXPECT_EQ(started_, std::vector<std::string>{"ticket-1"});
    EXPECT_EQ(completed_, std::vector<std::string>{"/videos/1000"});
    EXPECT_TRUE(reconciled_.empty());
    EXPECT_TRUE(failed_.empty());
}

TEST_F(UploadClientTest, FollowsTheWireProtocol) {
    ASSERT_TRUE(client_.upload_entire_file(source_, 100).is_ok());

    const auto& requests = transport_.requests;
    ASSERT_EQ(requests.size(), 6u);

    EXPECT_EQ(requests[0].method, HttpMethod::POST);
    EXPECT_EQ(requests[0].url, server_.base_url() + "/me/videos?type=streaming");
    EXPECT_TRUE(requests[0].requires_auth);

    for (std::size_t i = 1; i <= 3; ++i) {
        EXPECT_EQ(requests[i].method, HttpMethod::PUT);
        EXPECT_EQ(requests[i].url, server_.base_url() + "/upload/ticket-1");
        EXPECT_FALSE(requests[i].requires_auth);
        EXPECT_FALSE(requests[i].has_header("Content-Range"));
    }
    EXPECT_EQ(requests[3].body.size(), 50u);

    EXPECT_EQ(requests[4].method, HttpMethod::PUT);
    EXPECT_TRUE(requests[4].body.empty());
    EXPECT_EQ(requests[4].get_header("Content-Range"), "bytes */250");

    EXPECT_EQ(requests[5].method, HttpMethod::DELETE_METHOD);
    EXPECT_EQ(requests[5].url, server_.base_url() + "/uploads/ticket-1");
    EXPECT_TRUE(requests[5].requires_auth);
}

TEST_F(UploadClientTest, ResendsFromServerOffsetAfterTruncation) {
    MockUploadServer::Faults faults;
    faults.truncate_to = 150;
    server_.inject(faults);

    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    const std::vector<ByteRange> expected{{0, 100}, {100, 200}, {200, 250}, {150, 250}};
    EXPECT_EQ(chunks_, expected);
    ASSERT_EQ(reconciled_.size(), 1u);
    EXPECT_EQ(reconciled_[0].client_bytes_written, 250u);
    EXPECT_EQ(reconciled_[0].server_bytes_written, 150u);
    EXPECT_EQ(stored(), content_);
    EXPECT_TRUE(session.value().is_completed());
}

TEST_F(UploadClientTest, RecoversFromDroppedChunks) {
    MockUploadServer::Faults faults;
    faults.drop_after_chunks = 1;
    faults.drop_chunks = 1;
    server_.inject(faults);

    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    const std::vector<ByteRange> expected{{0, 100}, {100, 200}, {200, 250}, {100, 200}, {200, 250}};
    EXPECT_EQ(chunks_, expected);
    ASSERT_EQ(reconciled_.size(), 1u);
    EXPECT_EQ(reconciled_[0].server_bytes_written, 100u);
    EXPECT_EQ(stored(), content_);
}

TEST_F(UploadClientTest, NonSeekableSourceUploadsWithoutReconciliation) {
    MemoryContentSource stream(content_, false);

    auto session = client_.upload_entire_file(stream, 64);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    EXPECT_EQ(chunks_.size(), 4u);
    EXPECT_EQ(chunks_.back(), (ByteRange{192, 250}));
    EXPECT_EQ(stored(), content_);
}

TEST_F(UploadClientTest, NonSeekableSourceCannotRewindForResend) {
    MemoryContentSource stream(content_, false);
    MockUploadServer::Faults faults;
    faults.truncate_to = 150;
    server_.inject(faults);

    auto session = client_.upload_entire_file(stream, 100);

    ASSERT_TRUE(session.is_error());
    EXPECT_EQ(session.error().kind, ErrorKind::Upload);
    EXPECT_EQ(session.error().step, "upload_chunk");
    ASSERT_TRUE(session.error().session.has_value());
    EXPECT_EQ(session.error().session->state, UploadState::Failed);
    EXPECT_EQ(session.error().session->bytes_written, 150u);
    ASSERT_EQ(failed_.size(), 1u);
}

TEST_F(UploadClientTest, ResumeStatusOnChunkTriggersVerification) {
    MockUploadServer::Faults faults;
    faults.resume_on_chunks = 1;
    server_.inject(faults);

    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    auto first = client_.continue_upload(session.value());
    ASSERT_TRUE(first.is_ok()) << first.error().describe();

    EXPECT_EQ(first.value().status, VerificationStatus::InProgress);
    EXPECT_EQ(first.value().bytes_written, 100u);
    EXPECT_EQ(session.value().bytes_written(), 100u);
    EXPECT_EQ(session.value().state(), UploadState::InProgress);
    EXPECT_TRUE(chunks_.empty());
    EXPECT_EQ(server_.upload("ticket-1")->probe_requests, 1u);

    ASSERT_TRUE(client_.upload_session(session.value()).is_ok());
    EXPECT_EQ(stored(), content_);
}

TEST_F(UploadClientTest, StartUploadSendsFirstChunk) {
    auto session = client_.start_upload(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    EXPECT_EQ(session.value().bytes_written(), 100u);
    EXPECT_EQ(session.value().state(), UploadState::InProgress);
    EXPECT_EQ(chunks_, std::vector<ByteRange>{(ByteRange{0, 100})});
}

TEST_F(UploadClientTest, ZeroLengthFileSkipsChunks) {
    MemoryContentSource empty(std::vector<std::uint8_t>{});

    auto session = client_.upload_entire_file(empty, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    EXPECT_TRUE(session.value().is_completed());
    EXPECT_TRUE(chunks_.empty());
    const auto upload = server_.upload("ticket-1");
    ASSERT_TRUE(upload.has_value());
    EXPECT_EQ(upload->chunk_requests, 0u);
    EXPECT_EQ(upload->probe_requests, 1u);
    EXPECT_TRUE(upload->completed);
}

TEST_F(UploadClientTest, ContinueUploadIsNoOpOnceAllBytesWritten) {
    MemoryContentSource empty(std::vector<std::uint8_t>{});
    auto session = client_.create_session(empty, 100);
    ASSERT_TRUE(session.is_ok());
    const auto before = transport_.requests.size();

    auto result = client_.continue_upload(session.value());
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, VerificationStatus::InProgress);
    EXPECT_EQ(result.value().bytes_written, 0u);
    EXPECT_EQ(transport_.requests.size(), before);
}

TEST_F(UploadClientTest, CompletionRequiresVerifiedSession) {
    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok());

    auto clip = client_.complete_upload(session.value());
    ASSERT_TRUE(clip.is_error());
    EXPECT_EQ(clip.error().kind, ErrorKind::Precondition);
    EXPECT_EQ(count_requests(HttpMethod::DELETE_METHOD), 0u);
    EXPECT_FALSE(session.value().is_completed());
}

TEST_F(UploadClientTest, StepwiseUploadCompletesAfterVerification) {
    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(client_.continue_upload(session.value()).is_ok());
    }
    EXPECT_EQ(session.value().state(), UploadState::AwaitingVerification);

    auto verification = client_.verify_upload(session.value());
    ASSERT_TRUE(verification.is_ok());
    EXPECT_EQ(verification.value().status, VerificationStatus::Completed);
    EXPECT_TRUE(session.value().is_verified_complete());

    auto clip = client_.complete_upload(session.value());
    ASSERT_TRUE(clip.is_ok()) << clip.error().describe();
    EXPECT_EQ(clip.value(), "/videos/1000");
    EXPECT_TRUE(session.value().is_completed());
}

TEST_F(UploadClientTest, MissingLocationStillCompletes) {
    MockUploadServer::Faults faults;
    faults.omit_location = true;
    server_.inject(faults);

    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_ok());
    EXPECT_TRUE(session.value().is_completed());
    EXPECT_TRUE(session.value().clip_uri().empty());
}

TEST_F(UploadClientTest, MalformedRangeIsNotAdopted) {
    MockUploadServer::Faults faults;
    faults.truncate_to = 150;
    faults.malformed_range_replies = 1;
    server_.inject(faults);

    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    // Only the well-formed second reply moves the offset
    ASSERT_EQ(reconciled_.size(), 1u);
    EXPECT_EQ(reconciled_[0].server_bytes_written, 150u);
    EXPECT_EQ(server_.upload("ticket-1")->probe_requests, 3u);
    EXPECT_EQ(stored(), content_);
}

TEST_F(UploadClientTest, GivesUpAfterRepeatedUninformativeVerifications) {
    MockUploadServer::Faults faults;
    faults.truncate_to = 150;
    faults.omit_range_replies = 10;
    server_.inject(faults);

    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok());

    auto result = client_.upload_session(session.value());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Upload);
    EXPECT_EQ(result.error().message, "Server did not report an upload offset after 3 verifications.");
    EXPECT_TRUE(result.error().retryable);
    EXPECT_EQ(session.value().state(), UploadState::Failed);
    EXPECT_EQ(server_.upload("ticket-1")->probe_requests, 3u);
    ASSERT_EQ(failed_.size(), 1u);
    EXPECT_TRUE(failed_[0].retryable);

    // Once the server reports offsets again the same session finishes
    server_.inject(MockUploadServer::Faults{});
    ASSERT_TRUE(client_.upload_session(session.value()).is_ok());
    EXPECT_TRUE(session.value().is_completed());
    EXPECT_EQ(stored(), content_);
}

TEST_F(UploadClientTest, ResumesFromErrorSnapshotOnSameTicket) {
    MockUploadServer::Faults faults;
    faults.truncate_to = 150;
    faults.omit_range_replies = 10;
    server_.inject(faults);

    auto failed = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(failed.is_error());
    ASSERT_TRUE(failed.error().session.has_value());
    const SessionSnapshot snapshot = *failed.error().session;
    EXPECT_EQ(snapshot.state, UploadState::Failed);
    EXPECT_EQ(snapshot.ticket.ticket_id, "ticket-1");
    EXPECT_EQ(snapshot.chunk_size, 100u);
    EXPECT_TRUE(snapshot.retryable);

    server_.inject(MockUploadServer::Faults{});
    auto resumed = client_.resume_session(snapshot, source_);
    ASSERT_TRUE(resumed.is_ok()) << resumed.error().describe();
    EXPECT_EQ(resumed.value().state(), UploadState::Failed);
    EXPECT_EQ(resumed.value().bytes_written(), 250u);

    ASSERT_TRUE(client_.upload_session(resumed.value()).is_ok());
    EXPECT_TRUE(resumed.value().is_completed());
    EXPECT_EQ(stored(), content_);
    EXPECT_EQ(count_requests(HttpMethod::POST), 1u);
}

TEST_F(UploadClientTest, ResumeRejectsSnapshotForDifferentContent) {
    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok());

    MemoryContentSource other(counting_bytes(90));
    auto resumed = client_.resume_session(session.value().snapshot(), other);
    ASSERT_TRUE(resumed.is_error());
    EXPECT_EQ(resumed.error().kind, ErrorKind::Precondition);
    EXPECT_EQ(resumed.error().step, "resume_session");
}

TEST_F(UploadClientTest, ResumesAfterTransportFailure) {
    auto session = client_.create_session(source_, 100);
    ASSERT_TRUE(session.is_ok());
    ASSERT_TRUE(client_.continue_upload(session.value()).is_ok());

    transport_.fail_next(1);
    auto interrupted = client_.upload_session(session.value());
    ASSERT_TRUE(interrupted.is_error());
    EXPECT_EQ(interrupted.error().kind, ErrorKind::Upload);
    EXPECT_EQ(interrupted.error().step, "upload_chunk");
    EXPECT_EQ(interrupted.error().cause, "Connection reset by peer");
    EXPECT_EQ(session.value().state(), UploadState::Failed);
    EXPECT_EQ(session.value().bytes_written(), 100u);

    ASSERT_TRUE(client_.upload_session(session.value()).is_ok());
    EXPECT_TRUE(session.value().is_completed());
    EXPECT_EQ(stored(), content_);

    const std::vector<ByteRange> expected{{0, 100}, {100, 200}, {200, 250}};
    EXPECT_EQ(chunks_, expected);
}

TEST_F(UploadClientTest, ReplaceUploadKeepsVideoId) {
    auto session = client_.upload_entire_file(source_, 100, 77);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    EXPECT_EQ(transport_.requests[0].method, HttpMethod::PUT);
    EXPECT_EQ(transport_.requests[0].url, server_.base_url() + "/videos/77/files?type=streaming");
    EXPECT_EQ(session.value().ticket().uri, "/videos/77");
    EXPECT_EQ(session.value().clip_uri(), "/videos/77");
}

TEST_F(UploadClientTest, ZeroChunkSizeIsRejectedBeforeAnyRequest) {
    auto session = client_.upload_entire_file(source_, 0);
    ASSERT_TRUE(session.is_error());
    EXPECT_EQ(session.error().kind, ErrorKind::Precondition);
    EXPECT_TRUE(transport_.requests.empty());
}

TEST_F(UploadClientTest, UnreadableSourceIsRejectedBeforeAnyRequest) {
    source_.close();
    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_error());
    EXPECT_EQ(session.error().kind, ErrorKind::Precondition);
    EXPECT_TRUE(transport_.requests.empty());
}

TEST_F(LowQuotaUploadClientTest, QuotaExceededBeforeAnyChunk) {
    auto session = client_.upload_entire_file(source_, 100);
    ASSERT_TRUE(session.is_error());
    EXPECT_EQ(session.error().kind, ErrorKind::Upload);
    EXPECT_FALSE(session.error().retryable);
    EXPECT_EQ(transport_.requests.size(), 1u);
    EXPECT_EQ(server_.upload("ticket-1")->chunk_requests, 0u);
    EXPECT_TRUE(started_.empty());
}

TEST(UploadClientScriptedTest, NotFoundVerificationIsFatal) {
    ScriptedTransport transport;
    transport.push(make_response(201, {}, R"({
        "ticket_id": "t1",
        "upload_link_secure": "http://upload.test/upload/t1",
        "complete_uri": "/uploads/t1",
        "user": {"upload_quota": {"space": {"free": 1000}}}
    })"));
    transport.push(make_response(200));
    transport.push(make_response(404));

    UploadClient client(transport, {"http://api.test"});
    MemoryContentSource source(counting_bytes(50));
    auto session = client.create_session(source, 100);
    ASSERT_TRUE(session.is_ok()) << session.error().describe();

    auto result = client.upload_session(session.value());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Protocol);
    EXPECT_EQ(result.error().step, "verify_upload");
    EXPECT_EQ(result.error().status_code, 404);
    EXPECT_FALSE(result.error().retryable);
    EXPECT_EQ(transport.requests.size(), 3u);

    // A permanent failure cannot be resumed
    EXPECT_TRUE(client.upload_session(session.value()).is_error());
    EXPECT_EQ(transport.requests.size(), 3u);
}

TEST(UploadClientScriptedTest, UninformativeLimitIsConfigurable) {
    ScriptedTransport transport;
    transport.push(make_response(201, {}, R"({
        "ticket_id": "t1",
        "upload_link_secure": "http://upload.test/upload/t1",
        "complete_uri": "/uploads/t1",
        "user": {"upload_quota": {"space": {"free": 1000}}}
    })"));
    transport.push(make_response(200));
    transport.push(make_response(308));

    UploadClient client(transport, {"http://api.test", 0});
    EXPECT_EQ(client.options().max_uninformative_verifications, 1u);

    MemoryContentSource source(counting_bytes(50));
    auto session = client.create_session(source, 100);
    ASSERT_TRUE(session.is_ok());

    auto result = client.upload_session(session.value());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().message, "Server did not report an upload offset after 1 verifications.");
    EXPECT_EQ(transport.remaining(), 0u);
}

TEST(UploadClientScriptedTest, RetriedChunkStartsAtConfirmedOffset) {
    ScriptedTransport transport;
    transport.push_error("Connection reset by peer");
    transport.push(make_response(200));

    UploadClient client(transport, {"http://api.test"});
    MemoryContentSource source(counting_bytes(250));
    UploadSession session(make_ticket(), source, 100);
    ASSERT_TRUE(session.begin().is_ok());

    auto interrupted = client.continue_upload(session);
    ASSERT_TRUE(interrupted.is_error());
    EXPECT_EQ(interrupted.error().cause, "Connection reset by peer");
    EXPECT_EQ(session.bytes_written(), 0u);

    ASSERT_TRUE(client.continue_upload(session).is_ok());
    ASSERT_EQ(transport.requests.size(), 2u);
    const auto& retried = transport.requests.back();
    ASSERT_EQ(retried.body.size(), 100u);
    EXPECT_EQ(retried.body.front(), 0);
    EXPECT_EQ(retried.body.back(), 99);
    EXPECT_EQ(session.bytes_written(), 100u);
}

class ApplyVerificationTest : public ::testing::Test {
protected:
    ApplyVerificationTest()
        : source_(counting_bytes(250))
        , session_(make_ticket(), source_, 100) {}

    void SetUp() override {
        ASSERT_TRUE(session_.begin().is_ok());
        for (int i = 0; i < 3; ++i) {
            ASSERT_TRUE(session_.record_chunk_sent().is_ok());
        }
        ASSERT_EQ(session_.state(), UploadState::AwaitingVerification);
    }

    static VerificationResult in_progress(std::optional<std::uint64_t> bytes) {
        VerificationResult result;
        result.status = VerificationStatus::InProgress;
        result.bytes_written = bytes;
        result.status_code = 308;
        return result;
    }

    MemoryContentSource source_;
    UploadSession session_;
};

TEST_F(ApplyVerificationTest, CompletedMarksSessionVerified) {
    VerificationResult result;
    result.status = VerificationStatus::Completed;
    result.bytes_written = 250;

    auto next = apply_verification(session_, result);
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value(), NextStep::Complete);
    EXPECT_TRUE(session_.is_verified_complete());
}

TEST_F(ApplyVerificationTest, ServerOffsetBelowLengthIsAdopted) {
    auto next = apply_verification(session_, in_progress(150));
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value(), NextStep::SendChunks);
    EXPECT_EQ(session_.bytes_written(), 150u);
    EXPECT_EQ(session_.state(), UploadState::InProgress);
}

TEST_F(ApplyVerificationTest, FullCountWithoutCompletionIsFatal) {
    auto next = apply_verification(session_, in_progress(250));
    ASSERT_TRUE(next.is_error());
    EXPECT_EQ(next.error().kind, ErrorKind::Upload);
    EXPECT_FALSE(next.error().retryable);
    EXPECT_NE(next.error().message.find("250"), std::string::npos);
    EXPECT_EQ(session_.state(), UploadState::AwaitingVerification);

    EXPECT_TRUE(apply_verification(session_, in_progress(400)).is_error());
}

TEST_F(ApplyVerificationTest, NotFoundIsFatal) {
    VerificationResult result;
    result.status = VerificationStatus::NotFound;
    result.status_code = 410;

    auto next = apply_verification(session_, result);
    ASSERT_TRUE(next.is_error());
    EXPECT_EQ(next.error().kind, ErrorKind::Protocol);
    EXPECT_EQ(next.error().status_code, 410);
    EXPECT_FALSE(next.error().retryable);
}

TEST_F(ApplyVerificationTest, MissingOffsetAfterAllBytesAsksForAnotherProbe) {
    auto next = apply_verification(session_, in_progress(std::nullopt));
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value(), NextStep::Reverify);
    EXPECT_EQ(session_.state(), UploadState::AwaitingVerification);
}

TEST(ApplyVerificationStateTest, MissingOffsetWithBytesLeftResumesSending) {
    MemoryContentSource source(counting_bytes(250));
    UploadSession session(make_ticket(), source, 100);
    ASSERT_TRUE(session.begin().is_ok());
    ASSERT_TRUE(session.record_chunk_sent().is_ok());
    ASSERT_TRUE(session.request_verification().is_ok());

    VerificationResult result;
    result.status = VerificationStatus::InProgress;

    auto next = apply_verification(session, result);
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value(), NextStep::SendChunks);
    EXPECT_EQ(session.state(), UploadState::InProgress);
    EXPECT_EQ(session.bytes_written(), 100u);
}

TEST(ApplyVerificationStateTest, RequiresAwaitingVerification) {
    MemoryContentSource source(counting_bytes(250));
    UploadSession session(make_ticket(), source, 100);
    ASSERT_TRUE(session.begin().is_ok());

    VerificationResult result;
    result.status = VerificationStatus::Completed;

    auto next = apply_verification(session, result);
    ASSERT_TRUE(next.is_error());
    EXPECT_EQ(next.error().kind, ErrorKind::Precondition);
}
