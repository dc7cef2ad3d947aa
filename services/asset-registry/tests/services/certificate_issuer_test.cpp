/**
 * @file certificate_issuer_test.cpp
 * @brief Certificate payload format, uniqueness and failure accounting
 */

#include <gtest/gtest.h>
#include "services/certificate_issuer.h"
#include "exceptions.h"
#include "Base64Util.hpp"
#include <cstring>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using services::CertificateIssuer;

namespace {

// Deterministic sources so payloads can be compared across issuers
void zeroBytes(uint8_t* out, size_t length) {
    std::memset(out, 0, length);
}

std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1709622489));
}

bool isBase64UrlChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_';
}

} // anonymous namespace

// ============================================================================
// Constructor Validation
// ============================================================================

TEST(CertificateIssuerTest, Constructor_EmptySourcesThrow) {
    EXPECT_THROW(CertificateIssuer(nullptr, fixedTime), std::invalid_argument);
    EXPECT_THROW(CertificateIssuer(zeroBytes, nullptr), std::invalid_argument);
}

// ============================================================================
// Payload format
// ============================================================================

TEST(CertificateIssuerTest, Issue_PayloadIsUnpaddedBase64UrlOfSha512) {
    CertificateIssuer issuer;
    auto cert = issuer.issue("asset-1");

    ASSERT_EQ(cert.payload.size(), 86u);
    for (char c : cert.payload) {
        EXPECT_TRUE(isBase64UrlChar(c)) << "unexpected character '" << c << "'";
    }
    EXPECT_EQ(shared::util::Base64Util::decodeUrlSafe(cert.payload).size(), 64u);
}

TEST(CertificateIssuerTest, Issue_BindsAssetAndAssignsId) {
    CertificateIssuer issuer(zeroBytes, fixedTime);
    auto cert = issuer.issue("asset-1");

    EXPECT_EQ(cert.assetId, "asset-1");
    EXPECT_EQ(cert.id.size(), 24u);
    EXPECT_EQ(cert.createdAt, "2024-03-05T07:08:09.000000Z");
}

TEST(CertificateIssuerTest, Issue_CounterChangesPayloadWithIdenticalEntropy) {
    CertificateIssuer first(zeroBytes, fixedTime);
    CertificateIssuer second(zeroBytes, fixedTime);

    // Same counter, clock and entropy: same digest
    EXPECT_EQ(first.issue("asset-1").payload, second.issue("asset-1").payload);

    // Only the counter differs now
    std::string a = first.issue("asset-1").payload;
    second.issue("asset-1");
    std::string b = second.issue("asset-1").payload;
    EXPECT_NE(a, b);
}

TEST(CertificateIssuerTest, Issue_AssetIdChangesPayload) {
    CertificateIssuer first(zeroBytes, fixedTime);
    CertificateIssuer second(zeroBytes, fixedTime);

    EXPECT_NE(first.issue("asset-1").payload, second.issue("asset-2").payload);
}

// ============================================================================
// Uniqueness under concurrency
// ============================================================================

TEST(CertificateIssuerTest, Issue_ConcurrentCallsNeverCollide) {
    CertificateIssuer issuer;
    constexpr int THREADS = 10;
    constexpr int PER_THREAD = 100;

    std::mutex mutex;
    std::set<std::string> ids;
    std::set<std::string> payloads;

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                auto cert = issuer.issue("shared-asset");
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(cert.id);
                payloads.insert(cert.payload);
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(ids.size(), static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(payloads.size(), static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(issuer.attempts(), static_cast<uint64_t>(THREADS * PER_THREAD));
}

// ============================================================================
// Failure accounting
// ============================================================================

TEST(CertificateIssuerTest, Issue_EntropyFailureRaisesIssuanceError) {
    CertificateIssuer issuer(
        [](uint8_t*, size_t) { throw std::runtime_error("entropy source exhausted"); },
        fixedTime);

    EXPECT_THROW(issuer.issue("asset-1"), common::IssuanceException);
    EXPECT_THROW(issuer.issue("asset-1"), common::IssuanceException);
    EXPECT_EQ(issuer.attempts(), 2u);
}

TEST(CertificateIssuerTest, Issue_ClockFailureRaisesIssuanceError) {
    CertificateIssuer issuer(
        zeroBytes,
        []() -> std::chrono::system_clock::time_point {
            throw std::runtime_error("clock unavailable");
        });

    try {
        issuer.issue("asset-1");
        FAIL() << "expected IssuanceException";
    } catch (const common::IssuanceException& e) {
        EXPECT_EQ(e.code(), common::ErrorCode::Issuance);
    }
    EXPECT_EQ(issuer.attempts(), 1u);
}

TEST(CertificateIssuerTest, Issue_CounterAdvancesAcrossFailureAndSuccess) {
    bool failNext = true;
    CertificateIssuer issuer(
        [&failNext](uint8_t* out, size_t length) {
            if (failNext) {
                failNext = false;
                throw std::runtime_error("transient");
            }
            zeroBytes(out, length);
        },
        fixedTime);

    EXPECT_THROW(issuer.issue("asset-1"), common::IssuanceException);
    EXPECT_NO_THROW(issuer.issue("asset-1"));
    EXPECT_EQ(issuer.attempts(), 2u);
}
