#ifndef QUIETMQTT_USAGE_ERROR_HPP_
#define QUIETMQTT_USAGE_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace quietmqtt
{

    // Thrown when an operation is called in a state where it cannot run,
    // e.g. publish before start().
    class UsageError : public std::logic_error
    {
    public:
        explicit UsageError(const std::string &what) : std::logic_error(what) {}
    };

} // namespace quietmqtt
#endif // QUIETMQTT_USAGE_ERROR_HPP_
