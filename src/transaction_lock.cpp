#include "transaction_lock.hpp"
#include <algorithm>

bool TransactionLock::acquire(const std::optional<Deadline>& deadline) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    const uint64_t ticket = next_ticket++;
    queue.push_back(ticket);

    auto my_turn = [&] { return !held && queue.front() == ticket; };

    bool granted;
    if (deadline) {
        granted = turn_changed.wait_until(lock, *deadline, my_turn);
    } else {
        turn_changed.wait(lock, my_turn);
        granted = true;
    }

    if (!granted) {
        queue.erase(std::find(queue.begin(), queue.end(), ticket));
        // The next waiter may have been queued behind us
        turn_changed.notify_all();
        return false;
    }
    queue.pop_front();
    held = true;
    return true;
}

void TransactionLock::release() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        held = false;
    }
    turn_changed.notify_all();
}

size_t TransactionLock::waiting() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return queue.size();
}
