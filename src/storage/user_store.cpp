#include "storage/user_store.hpp"
#include <algorithm>
#include <mutex>
#include "common/assert.hpp"
#include "common/logging.hpp"

namespace userapi {

std::vector<User> UserStore::listUsers(int64_t page, int64_t pageSize) {
    if (page < 1 || pageSize < 1)
        return {};

    std::lock_guard<std::mutex> l(mutex);
    auto count = static_cast<int64_t>(users.size());
    // compare page counts rather than offsets so huge page numbers cannot overflow
    auto pageCount = count / pageSize + (count % pageSize != 0 ? 1 : 0);
    if (page - 1 >= pageCount)
        return {};

    auto offset = (page - 1) * pageSize;
    uapi_assert(offset < count, "Page offset {} past end of store ({} users)", offset, count);
    auto end = offset + std::min(pageSize, count - offset);
    return std::vector<User>(users.begin() + offset, users.begin() + end);
}

std::optional<User> UserStore::getUser(user_id_t id) {
    std::lock_guard<std::mutex> l(mutex);
    auto it = std::find_if(users.begin(), users.end(), [id](const User& u) { return u.id == id; });
    if (it == users.end())
        return std::nullopt;
    return *it;
}

void UserStore::addUser(const User& user) {
    std::lock_guard<std::mutex> l(mutex);
    users.push_back(user);
    Logger::debug("Stored {} ({} users)", user, users.size());
}

bool UserStore::addUserIfAbsent(const User& user) {
    std::lock_guard<std::mutex> l(mutex);
    auto id = user.id;
    if (std::any_of(users.begin(), users.end(), [id](const User& u) { return u.id == id; }))
        return false;
    users.push_back(user);
    Logger::debug("Stored {} ({} users)", user, users.size());
    return true;
}

bool UserStore::updateUser(user_id_t id, const User& updated) {
    std::lock_guard<std::mutex> l(mutex);
    auto it = std::find_if(users.begin(), users.end(), [id](const User& u) { return u.id == id; });
    if (it == users.end())
        return false;
    *it = updated;
    return true;
}

size_t UserStore::deleteUser(user_id_t id) {
    std::lock_guard<std::mutex> l(mutex);
    auto removed = std::erase_if(users, [id](const User& u) { return u.id == id; });
    if (removed > 1)
        Logger::warn("Removed {} users sharing id {}", removed, id);
    return removed;
}

size_t UserStore::size() {
    std::lock_guard<std::mutex> l(mutex);
    return users.size();
}

}  // namespace userapi
