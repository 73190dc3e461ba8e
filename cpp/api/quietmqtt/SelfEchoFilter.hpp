#ifndef QUIETMQTT_SELF_ECHO_FILTER_HPP_
#define QUIETMQTT_SELF_ECHO_FILTER_HPP_

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "Message.hpp"
#include "dllexport.h"

namespace quietmqtt
{

    // Decides whether an inbound message is this session's own publication.
    //
    // Two checks, in order:
    //  1. identity tag: the message carries the user property "publisherId"
    //     equal to this session's identity. Exact, no time bound.
    //  2. fingerprint window: a publish to the same topic with the same
    //     fingerprint was recorded no more than windowMs ago. Two publishers
    //     sending identical bytes to one topic inside the window cannot be
    //     told apart; the second one is suppressed too.
    //
    // The record buffer is shared between publishing threads and the inbound
    // path and is guarded by a mutex.
    class SelfEchoFilter
    {
    public:
        using Clock = std::function<int64_t()>;

        struct Fingerprint
        {
            uint64_t digest{0};
            uint64_t length{0};

            bool operator==(const Fingerprint &other) const
            {
                return digest == other.digest && length == other.length;
            }
        };

        struct RecentPublish
        {
            std::string topic;
            Fingerprint fingerprint;
            int64_t timestampMs;
        };

        static constexpr const char *IDENTITY_PROPERTY = "publisherId";
        static constexpr size_t MAX_RECORDS = 100;
        static constexpr int64_t MAX_RECORD_AGE_MS = 7000;
        static constexpr size_t FINGERPRINT_PREFIX_BYTES = 512;
        static constexpr int64_t DEFAULT_WINDOW_MS = 100;

        // clock returns milliseconds on a monotonic scale; defaults to steady_clock.
        QUIETMQTT_DLLEXPORT explicit SelfEchoFilter(const std::string &publisherIdentity,
                                                    Clock clock = Clock());

        QUIETMQTT_DLLEXPORT const std::string &getPublisherIdentity() const;

        // Records an outbound publish. Evicts by age first, then keeps the
        // newest MAX_RECORDS entries.
        QUIETMQTT_DLLEXPORT void recordPublish(const std::string &topic,
                                               const uint8_t *payload,
                                               size_t length);

        QUIETMQTT_DLLEXPORT bool isOwnEcho(const Message &message, int64_t windowMs) const;

        QUIETMQTT_DLLEXPORT bool hasOwnIdentityTag(const Message &message) const;
        QUIETMQTT_DLLEXPORT bool matchesRecentPublish(const std::string &topic,
                                                      const uint8_t *payload,
                                                      size_t length,
                                                      int64_t windowMs) const;

        // Drops every record; the identity is kept.
        QUIETMQTT_DLLEXPORT void reset();

        QUIETMQTT_DLLEXPORT size_t size() const;
        QUIETMQTT_DLLEXPORT std::vector<RecentPublish> snapshot() const;

        QUIETMQTT_DLLEXPORT static Fingerprint fingerprint(const uint8_t *payload, size_t length);

        // "self-<random base36>-<epoch ms>"
        QUIETMQTT_DLLEXPORT static std::string generateIdentity();

        QUIETMQTT_DLLEXPORT static int64_t steadyNowMs();

    private:
        void pruneLocked(int64_t now);

        const std::string identity_;
        Clock clock_;
        mutable std::mutex mutex_;
        std::deque<RecentPublish> records_;
    };

} // namespace quietmqtt
#endif // QUIETMQTT_SELF_ECHO_FILTER_HPP_
