/*
 * nanoclaw C++ - Host state sources
 *
 * Where snapshot inputs come from. The scheduler's task store and the
 * messaging platform's chat directory live outside this process; these
 * interfaces are what the orchestrator reads before each run.
 */
#ifndef nanoclaw_CORE_HOST_STATE_HPP
#define nanoclaw_CORE_HOST_STATE_HPP

#include "types.hpp"
#include <string>
#include <vector>

namespace nanoclaw {

class TaskSource {
public:
    virtual ~TaskSource() {}
    virtual std::vector<ScheduledTask> tasks() const = 0;
};

class ChatDirectory {
public:
    virtual ~ChatDirectory() {}
    virtual std::vector<AvailableGroup> chats() const = 0;
};

// <data_dir>/tasks.json: array of task objects
class JsonTaskSource : public TaskSource {
public:
    explicit JsonTaskSource(const std::string& path) : path_(path) {}
    std::vector<ScheduledTask> tasks() const override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// <data_dir>/chats.json: array of {"jid","name","lastActivity"}
class JsonChatDirectory : public ChatDirectory {
public:
    explicit JsonChatDirectory(const std::string& path) : path_(path) {}
    std::vector<AvailableGroup> chats() const override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace nanoclaw

#endif // nanoclaw_CORE_HOST_STATE_HPP
