#include "SelfEchoFilter.hpp"
#include <random>
#include <utility>
#include <fmt/format.h>

namespace quietmqtt
{

    namespace
    {
        std::string toBase36(uint64_t value)
        {
            static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
            std::string text;
            do
            {
                text.insert(text.begin(), digits[value % 36]);
                value /= 36;
            } while (value != 0);
            return text;
        }

        // 64-bit FNV-1a
        uint64_t digestBytes(const uint8_t *data, size_t length)
        {
            uint64_t h = 14695981039346656037ULL;
            for (size_t i = 0; i < length; ++i)
            {
                h ^= data[i];
                h *= 1099511628211ULL;
            }
            return h;
        }
    }

    SelfEchoFilter::SelfEchoFilter(const std::string &publisherIdentity, Clock clock)
        : identity_(publisherIdentity),
          clock_(clock ? std::move(clock) : Clock(&SelfEchoFilter::steadyNowMs))
    {
    }

    const std::string &SelfEchoFilter::getPublisherIdentity() const
    {
        return identity_;
    }

    SelfEchoFilter::Fingerprint SelfEchoFilter::fingerprint(const uint8_t *payload, size_t length)
    {
        Fingerprint fp;
        fp.length = length;
        size_t prefix = length < FINGERPRINT_PREFIX_BYTES ? length : FINGERPRINT_PREFIX_BYTES;
        fp.digest = digestBytes(payload, payload ? prefix : 0);
        return fp;
    }

    void SelfEchoFilter::recordPublish(const std::string &topic, const uint8_t *payload, size_t length)
    {
        RecentPublish record{topic, fingerprint(payload, length), 0};
        std::lock_guard<std::mutex> lock(mutex_);
        record.timestampMs = clock_();
        records_.push_back(std::move(record));
        pruneLocked(records_.back().timestampMs);
    }

    void SelfEchoFilter::pruneLocked(int64_t now)
    {
        while (!records_.empty() && now - records_.front().timestampMs >= MAX_RECORD_AGE_MS)
        {
            records_.pop_front();
        }
        while (records_.size() > MAX_RECORDS)
        {
            records_.pop_front();
        }
    }

    bool SelfEchoFilter::hasOwnIdentityTag(const Message &message) const
    {
        const std::string *tag = message.getUserProperty(IDENTITY_PROPERTY);
        return tag && *tag == identity_;
    }

    bool SelfEchoFilter::matchesRecentPublish(const std::string &topic,
                                              const uint8_t *payload,
                                              size_t length,
                                              int64_t windowMs) const
    {
        Fingerprint fp = fingerprint(payload, length);
        std::lock_guard<std::mutex> lock(mutex_);
        int64_t now = clock_();
        for (auto it = records_.rbegin(); it != records_.rend(); ++it)
        {
            int64_t age = now - it->timestampMs;
            if (age > windowMs)
            {
                break;
            }
            if (age >= 0 && it->topic == topic && it->fingerprint == fp)
            {
                return true;
            }
        }
        return false;
    }

    bool SelfEchoFilter::isOwnEcho(const Message &message, int64_t windowMs) const
    {
        if (hasOwnIdentityTag(message))
        {
            return true;
        }
        return matchesRecentPublish(message.getTopic(),
                                    message.getPayload(),
                                    message.getPayloadLength(),
                                    windowMs);
    }

    void SelfEchoFilter::reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

    size_t SelfEchoFilter::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    std::vector<SelfEchoFilter::RecentPublish> SelfEchoFilter::snapshot() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<RecentPublish>(records_.begin(), records_.end());
    }

    std::string SelfEchoFilter::generateIdentity()
    {
        std::random_device device;
        std::mt19937_64 engine((static_cast<uint64_t>(device()) << 32) ^ device());
        int64_t epochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::system_clock::now().time_since_epoch())
                              .count();
        return fmt::format("self-{}-{}", toBase36(engine()), epochMs);
    }

    int64_t SelfEchoFilter::steadyNowMs()
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::steady_clock::now().time_since_epoch())
            .count();
    }

} // namespace quietmqtt
