#pragma once

#include "marksync/core/Config.hpp"

namespace marksync {
namespace core {

struct RunSummary
{
    int files = 0;
    int failedFiles = 0;
    int tasks = 0;
    int created = 0;
    int updated = 0;
};

// One invocation: opens the store once, then synchronizes every target file
// in order. Returns a process exit code.
class SyncSession
{
public:
    explicit SyncSession(SyncConfig config);

    int run();

    const RunSummary &summary() const;

private:
    QStringList targetFiles() const;

    SyncConfig m_config;
    RunSummary m_summary;
};

} // namespace core
} // namespace marksync
