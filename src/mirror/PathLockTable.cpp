#include "PathLockTable.hpp"

namespace fs = std::filesystem;

namespace mirror
{

PathLockTable& PathLockTable::Instance()
{
    static PathLockTable table;
    return table;
}

std::shared_ptr<std::mutex> PathLockTable::acquire(const fs::path& path)
{
    const std::string key = canonicalKey(path);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks_[key];
    if (auto existing = slot.lock())
    {
        return existing;
    }

    auto created = std::make_shared<std::mutex>();
    slot = created;
    pruneExpiredLocked();
    return created;
}

std::size_t PathLockTable::size()
{
    std::lock_guard<std::mutex> lock(mutex_);
    pruneExpiredLocked();
    return locks_.size();
}

std::string PathLockTable::canonicalKey(const fs::path& path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec)
    {
        absolute = path;
    }

    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec)
    {
        canonical = absolute.lexically_normal();
    }
    return canonical.string();
}

void PathLockTable::pruneExpiredLocked()
{
    for (auto it = locks_.begin(); it != locks_.end();)
    {
        if (it->second.expired())
            it = locks_.erase(it);
        else
            ++it;
    }
}

} // namespace mirror
