#include "chunkup/upload/offset_verifier.hpp"

#include "support/fake_transport.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace chunkup::upload;
using chunkup::network::HttpMethod;
using chunkup::test::ScriptedTransport;
using chunkup::test::make_response;

namespace {

UploadTicket make_ticket(std::uint64_t free_space = 1u << 20) {
    UploadTicket ticket;
    ticket.ticket_id = "ticket-1";
    ticket.upload_link_secure = "http://upload.test/upload/ticket-1";
    ticket.complete_uri = "/uploads/ticket-1";
    ticket.free_space = free_space;
    return ticket;
}

class OffsetVerifierTest : public ::testing::Test {
protected:
    OffsetVerifierTest()
        : source_(std::vector<std::uint8_t>(250, 1))
        , session_(make_ticket(), source_, 100) {}

    void SetUp() override {
        ASSERT_TRUE(session_.begin().is_ok());
    }

    ScriptedTransport transport_;
    MemoryContentSource source_;
    UploadSession session_;
};

} // namespace

TEST_F(OffsetVerifierTest, SendsEmptyProbeWithoutAuth) {
    transport_.push(make_response(308, {{"Range", "bytes=0-100"}}));
    OffsetVerifier verifier(transport_);

    ASSERT_TRUE(verifier.verify(session_).is_ok());

    ASSERT_EQ(transport_.requests.size(), 1u);
    const auto& probe = transport_.requests[0];
    EXPECT_EQ(probe.method, HttpMethod::PUT);
    EXPECT_EQ(probe.url, "http://upload.test/upload/ticket-1");
    EXPECT_FALSE(probe.requires_auth);
    EXPECT_TRUE(probe.body.empty());
    EXPECT_EQ(probe.get_header("Content-Length"), "0");
    EXPECT_EQ(probe.get_header("Content-Range"), "bytes */250");
}

TEST_F(OffsetVerifierTest, ResumeIncompleteReportsServerOffset) {
    transport_.push(make_response(308, {{"Range", "bytes=0-150"}}));
    OffsetVerifier verifier(transport_);

    auto result = verifier.verify(session_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, VerificationStatus::InProgress);
    ASSERT_TRUE(result.value().bytes_written.has_value());
    EXPECT_EQ(*result.value().bytes_written, 150u);
    EXPECT_EQ(result.value().status_code, 308);
}

TEST_F(OffsetVerifierTest, RepeatedProbesAgainstStableServerAgree) {
    transport_.push(make_response(308, {{"Range", "bytes=0-150"}}));
    transport_.push(make_response(308, {{"Range", "bytes=0-150"}}));
    OffsetVerifier verifier(transport_);

    auto first = verifier.verify(session_);
    auto second = verifier.verify(session_);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().status, second.value().status);
    EXPECT_EQ(first.value().bytes_written, second.value().bytes_written);
    EXPECT_EQ(session_.bytes_written(), 0u);
    EXPECT_EQ(session_.state(), UploadState::InProgress);
}

TEST_F(OffsetVerifierTest, OkResponseReportsCompleted) {
    transport_.push(make_response(200));
    OffsetVerifier verifier(transport_);

    auto result = verifier.verify(session_);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, VerificationStatus::Completed);
}

TEST_F(OffsetVerifierTest, TransportFailureIsUploadError) {
    transport_.push_error("Timed out");
    OffsetVerifier verifier(transport_);

    auto result = verifier.verify(session_);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Upload);
    EXPECT_EQ(result.error().step, "verify_upload");
    EXPECT_EQ(result.error().cause, "Timed out");
    ASSERT_TRUE(result.error().session.has_value());
    EXPECT_EQ(result.error().session->ticket_id, "ticket-1");
}

TEST(OffsetVerifierPreconditionTest, QuotaIsCheckedBeforeAnyRequest) {
    ScriptedTransport transport;
    MemoryContentSource source(std::vector<std::uint8_t>(250, 1));
    UploadSession session(make_ticket(100), source, 100);
    ASSERT_TRUE(session.begin().is_ok());

    OffsetVerifier verifier(transport);
    auto result = verifier.verify(session);

    ASSERT_TRUE(result.is_error());
    EXPECT_FALSE(result.error().retryable);
    EXPECT_TRUE(transport.requests.empty());
}

TEST(OffsetVerifierPreconditionTest, MissingUploadLinkIsPrecondition) {
    ScriptedTransport transport;
    MemoryContentSource source(std::vector<std::uint8_t>(10, 1));
    UploadTicket ticket = make_ticket();
    ticket.upload_link_secure.clear();
    UploadSession session(ticket, source, 100);

    OffsetVerifier verifier(transport);
    auto result = verifier.verify(session);

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Precondition);
    EXPECT_TRUE(transport.requests.empty());
}

TEST(OffsetVerifierInterpretTest, OkMeansCompleted) {
    const auto result = OffsetVerifier::interpret(make_response(200), 250);
    EXPECT_EQ(result.status, VerificationStatus::Completed);
    EXPECT_EQ(result.bytes_written, 250u);
}

TEST(OffsetVerifierInterpretTest, FullRangeMeansCompleted) {
    const auto result = OffsetVerifier::interpret(make_response(308, {{"Range", "bytes=0-250"}}), 250);
    EXPECT_EQ(result.status, VerificationStatus::Completed);
    EXPECT_EQ(result.bytes_written, 250u);
}

TEST(OffsetVerifierInterpretTest, MissingRangeLeavesOffsetUnknown) {
    const auto result = OffsetVerifier::interpret(make_response(308), 250);
    EXPECT_EQ(result.status, VerificationStatus::InProgress);
    EXPECT_FALSE(result.bytes_written.has_value());
}

TEST(OffsetVerifierInterpretTest, MalformedRangeLeavesOffsetUnknown) {
    const auto result = OffsetVerifier::interpret(make_response(308, {{"Range", "bytes=garbage"}}), 250);
    EXPECT_EQ(result.status, VerificationStatus::InProgress);
    EXPECT_FALSE(result.bytes_written.has_value());
}

TEST(OffsetVerifierInterpretTest, RangeLookupIsCaseInsensitive) {
    const auto result = OffsetVerifier::interpret(make_response(308, {{"range", "bytes=0-10"}}), 250);
    EXPECT_EQ(result.bytes_written, 10u);
}

TEST(OffsetVerifierInterpretTest, OtherStatusesMeanNotFound) {
    for (int status : {201, 204, 400, 404, 410, 500}) {
        const auto result = OffsetVerifier::interpret(make_response(status), 250);
        EXPECT_EQ(result.status, VerificationStatus::NotFound) << status;
        EXPECT_FALSE(result.bytes_written.has_value()) << status;
        EXPECT_EQ(result.status_code, status);
    }
}

TEST(OffsetVerifierInterpretTest, ZeroLengthFileCompletesWithEmptyRange) {
    const auto result = OffsetVerifier::interpret(make_response(308, {{"Range", "bytes=0-0"}}), 0);
    EXPECT_EQ(result.status, VerificationStatus::Completed);
}
