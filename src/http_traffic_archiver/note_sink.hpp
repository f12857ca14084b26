#ifndef NOTE_SINK_HPP
#define NOTE_SINK_HPP

#include <string>

// Receives free-text diagnostics that must stay auditable in the archive
class NoteSink
{
   public:
    virtual ~NoteSink() = default;

    virtual void appendSystemNote(const std::string& message) = 0;
};

#endif  // NOTE_SINK_HPP
