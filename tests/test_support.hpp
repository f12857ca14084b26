#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "archive_types.hpp"
#include "note_sink.hpp"

struct RecordingNotes : NoteSink
{
    std::vector<std::string> notes;

    void appendSystemNote(const std::string& message) override { notes.push_back(message); }

    bool contains(const std::string& fragment) const
    {
        for (const auto& n : notes)
        {
            if (n.find(fragment) != std::string::npos)
                return true;
        }
        return false;
    }
};

// Clock the test advances by hand
struct ManualClock
{
    std::shared_ptr<std::chrono::system_clock::time_point> now =
        std::make_shared<std::chrono::system_clock::time_point>(std::chrono::milliseconds(1704164645678));

    std::chrono::system_clock::time_point operator()() const { return *now; }
    void advance(int64_t ms) { *now += std::chrono::milliseconds(ms); }
};

inline RawHeaders headers(std::initializer_list<std::pair<std::string, std::string>> lines)
{
    RawHeaders out;
    for (const auto& [name, value] : lines)
    {
        out.push_back(RawHeader{name, {value}});
    }
    return out;
}

#endif  // TEST_SUPPORT_HPP
