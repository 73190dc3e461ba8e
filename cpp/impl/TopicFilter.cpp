#include "TopicFilter.hpp"
#include <vector>

namespace quietmqtt
{

    namespace
    {
        std::vector<std::string> splitLevels(const std::string &text)
        {
            std::vector<std::string> levels;
            std::string::size_type start = 0;
            while (true)
            {
                std::string::size_type slash = text.find('/', start);
                if (slash == std::string::npos)
                {
                    levels.push_back(text.substr(start));
                    break;
                }
                levels.push_back(text.substr(start, slash - start));
                start = slash + 1;
            }
            return levels;
        }
    }

    bool TopicFilter::hasWildcards(const std::string &filter)
    {
        return filter.find_first_of("+#") != std::string::npos;
    }

    bool TopicFilter::isValidFilter(const std::string &filter)
    {
        if (filter.empty() || filter.find('\0') != std::string::npos)
        {
            return false;
        }
        std::vector<std::string> levels = splitLevels(filter);
        for (size_t i = 0; i < levels.size(); ++i)
        {
            const std::string &level = levels[i];
            if (level.find('#') != std::string::npos)
            {
                if (level != "#" || i + 1 != levels.size())
                    return false;
            }
            if (level.find('+') != std::string::npos && level != "+")
            {
                return false;
            }
        }
        return true;
    }

    bool TopicFilter::matches(const std::string &filter, const std::string &topic)
    {
        if (filter == topic)
        {
            return true;
        }
        if (!hasWildcards(filter))
        {
            return false;
        }
        if (!topic.empty() && topic[0] == '$' && (filter[0] == '+' || filter[0] == '#'))
        {
            return false;
        }

        std::vector<std::string> filterLevels = splitLevels(filter);
        std::vector<std::string> topicLevels = splitLevels(topic);

        size_t i = 0;
        for (; i < filterLevels.size(); ++i)
        {
            if (filterLevels[i] == "#")
            {
                return true;
            }
            if (i >= topicLevels.size())
            {
                return false;
            }
            if (filterLevels[i] != "+" && filterLevels[i] != topicLevels[i])
            {
                return false;
            }
        }
        return i == topicLevels.size();
    }

} // namespace quietmqtt
