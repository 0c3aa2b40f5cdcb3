#include "errors.hpp"
#include "request_ledger.hpp"
#include "test_support.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

using namespace cb;
using namespace cbtest;

namespace {

void registerLookupResolve() {
    RequestLedger ledger;
    ledger.registerRequest("req-1", 1, RequestKind::RISK_EVALUATION);
    ledger.registerRequest("req-2", 1, RequestKind::CONTENT_REVEAL);
    expect(ledger.pendingCount() == 2, "two requests should be pending");

    expectError(ErrorCode::DUPLICATE_REQUEST,
                [&] { ledger.registerRequest("req-1", 9, RequestKind::CONTENT_REVEAL); },
                "duplicate register");
    auto peeked = ledger.lookup("req-1");
    expect(peeked && peeked->recordId == 1 && peeked->kind == RequestKind::RISK_EVALUATION,
           "duplicate register overwrote the original entry");
    expect(ledger.contains("req-1"), "lookup must not consume");

    PendingRequest resolved = ledger.resolve("req-1");
    expect(resolved.requestId == "req-1" && resolved.recordId == 1, "resolve returned wrong entry");
    expect(!ledger.lookup("req-1").has_value(), "resolved entry still visible");
    expectError(ErrorCode::UNKNOWN_REQUEST, [&] { ledger.resolve("req-1"); }, "second resolve");
    expectError(ErrorCode::UNKNOWN_REQUEST, [&] { ledger.resolve("never"); }, "resolve unknown");
    expect(ledger.pendingCount() == 1, "only req-2 should remain");

    bool rejected = false;
    try {
        ledger.registerRequest("", 1, RequestKind::RISK_EVALUATION);
    } catch (const std::invalid_argument&) {
        rejected = true;
    }
    expect(rejected, "empty request id must be rejected");
}

void resolvedIdCannotBeRegisteredAgain() {
    RequestLedger ledger;
    ledger.registerRequest("tok-1", 1, RequestKind::RISK_EVALUATION);
    expect(!ledger.isRetired("tok-1"), "pending id reported as retired");
    ledger.resolve("tok-1");
    expect(ledger.isRetired("tok-1"), "resolved id must be retired");
    expect(ledger.contains("tok-1"), "retired id must still count as known");

    expectError(ErrorCode::DUPLICATE_REQUEST,
                [&] { ledger.registerRequest("tok-1", 2, RequestKind::RISK_EVALUATION); },
                "re-register a resolved id");
    expect(ledger.pendingCount() == 0, "retired id became pending again");
    expectError(ErrorCode::UNKNOWN_REQUEST, [&] { ledger.resolve("tok-1"); }, "resolve a retired id");
}

void concurrentRegistration() {
    RequestLedger ledger;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&ledger, t] {
            for (int i = 0; i < kPerThread; ++i) {
                ledger.registerRequest("t" + std::to_string(t) + "-" + std::to_string(i),
                                       static_cast<RecordId>(t * kPerThread + i + 1),
                                       RequestKind::RISK_EVALUATION);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    expect(ledger.pendingCount() == static_cast<std::size_t>(kThreads * kPerThread),
           "concurrent registrations were lost");
}

void concurrentResolveIsAtMostOnce() {
    RequestLedger ledger;
    ledger.registerRequest("contested", 4, RequestKind::CONTENT_REVEAL);

    constexpr int kThreads = 16;
    std::atomic<int> wins{ 0 };
    std::atomic<int> losses{ 0 };
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&] {
            try {
                ledger.resolve("contested");
                ++wins;
            } catch (const ProtocolError& ex) {
                if (ex.code() == ErrorCode::UNKNOWN_REQUEST) {
                    ++losses;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    expect(wins.load() == 1, "request resolved more than once");
    expect(losses.load() == kThreads - 1, "losers must see UnknownRequest");
}

} // namespace

int main() {
    spdlog::set_level(spdlog::level::warn);

    registerLookupResolve();
    resolvedIdCannotBeRegisteredAgain();
    concurrentRegistration();
    concurrentResolveIsAtMostOnce();

    std::cout << "request ledger tests passed\n";
    return 0;
}
