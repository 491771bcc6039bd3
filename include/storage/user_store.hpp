#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "model/user.hpp"

namespace userapi {

/**
 * @brief In-memory, insertion-ordered collection of users.
 *
 * None of the operations fail: absence is reported through nullopt, false or a
 * zero count. The store does not enforce unique ids; callers that need
 * uniqueness check getUser() first.
 */
class UserStore {
   public:
    static constexpr int64_t defaultPage = 1;
    static constexpr int64_t defaultPageSize = 10;

    UserStore() = default;

    // Non-copyable
    UserStore(const UserStore&) = delete;
    UserStore& operator=(const UserStore&) = delete;

    /**
     * @brief Returns at most pageSize users starting at offset (page - 1) * pageSize.
     * Non-positive page or pageSize yield an empty list.
     */
    std::vector<User> listUsers(int64_t page = defaultPage, int64_t pageSize = defaultPageSize);

    // First user with the given id
    std::optional<User> getUser(user_id_t id);

    // Appends to the end, even if the id is already present
    void addUser(const User& user);

    // Appends only if no user has the same id. Returns false if one does.
    bool addUserIfAbsent(const User& user);

    // Replaces the first match in place. Returns false if no user has this id.
    bool updateUser(user_id_t id, const User& updated);

    // Removes every user with the given id and returns how many were removed
    size_t deleteUser(user_id_t id);

    size_t size();

   private:
    std::mutex mutex;
    std::vector<User> users;
};

}  // namespace userapi
