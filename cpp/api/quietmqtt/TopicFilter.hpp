#ifndef QUIETMQTT_TOPIC_FILTER_HPP_
#define QUIETMQTT_TOPIC_FILTER_HPP_

#include <string>
#include "dllexport.h"

namespace quietmqtt
{

    class TopicFilter
    {
    public:
        // '+' matches exactly one level, a trailing '#' matches the parent
        // level and everything below it. Topics starting with '$' are not
        // matched by a leading wildcard.
        QUIETMQTT_DLLEXPORT static bool matches(const std::string &filter, const std::string &topic);

        // Non-empty, no NUL, '+' only as a whole level, '#' only as the last level.
        QUIETMQTT_DLLEXPORT static bool isValidFilter(const std::string &filter);

        QUIETMQTT_DLLEXPORT static bool hasWildcards(const std::string &filter);
    };

} // namespace quietmqtt
#endif // QUIETMQTT_TOPIC_FILTER_HPP_
