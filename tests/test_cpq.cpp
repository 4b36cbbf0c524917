#include "test_common.h"

#include "evogate/cpq.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using evogate::ConcurrentPriorityQueue;

int main() {
    ConcurrentPriorityQueue<std::string> q;

    q.push(0, "low");
    q.push(5, "hi1");
    q.push(5, "hi2");

    ConcurrentPriorityQueue<std::string>::Item it;
    expect_true(q.pop(it), "pop 1 should succeed");
    expect_true(it.priority == 5, "first item priority should be 5");
    std::string first = it.value;

    expect_true(q.pop(it), "pop 2 should succeed");
    expect_true(it.priority == 5, "second item priority should be 5");
    std::string second = it.value;

    // For equal priority, seq enforces FIFO
    expect_true(first == "hi1" && second == "hi2", "seq FIFO violated for same priority");

    expect_true(q.pop(it), "pop 3 should succeed");
    expect_true(it.priority == 0 && it.value == "low", "third item should be low priority");

    expect_true(!q.try_pop(it), "try_pop on empty queue");

    // Blocking pop should unblock on shutdown
    ConcurrentPriorityQueue<int> q2;
    bool popped = false;
    std::thread t([&] {
        ConcurrentPriorityQueue<int>::Item it2;
        bool ok = q2.pop(it2);
        popped = ok;
    });

    // Give the thread a moment to block
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    q2.shutdown();
    t.join();

    expect_true(popped == false, "pop should return false after shutdown on empty queue");

    // After shutdown: pushes refused, leftovers only reachable through drain()
    ConcurrentPriorityQueue<int> q3;
    q3.push(1, 10);
    q3.push(3, 30);
    q3.push(1, 11);
    q3.shutdown();
    expect_true(!q3.push(9, 90), "push after shutdown should be refused");
    ConcurrentPriorityQueue<int>::Item it3;
    expect_true(!q3.pop(it3), "pop after shutdown returns false even with items left");
    auto rest = q3.drain();
    expect_eq_ll((long long)rest.size(), 3, "drain returns leftovers");
    expect_eq_ll(rest[0].value, 30, "drain in pop order (priority)");
    expect_eq_ll(rest[1].value, 10, "drain in pop order (fifo)");
    expect_eq_ll(rest[2].value, 11, "drain in pop order (fifo 2)");
    expect_eq_ll((long long)q3.size(), 0, "empty after drain");

    // Erase drops one queued item and keeps the rest in order.
    ConcurrentPriorityQueue<std::string> q4;
    q4.push(0, "a");
    q4.push(0, "b");
    q4.push(0, "c");
    expect_true(q4.erase("b"), "erase queued item");
    expect_true(!q4.erase("b"), "erase twice");
    ConcurrentPriorityQueue<std::string>::Item it4;
    expect_true(q4.try_pop(it4) && it4.value == "a", "a first");
    expect_true(q4.try_pop(it4) && it4.value == "c", "then c");

    std::cerr << "test_cpq: ALL PASSED" << std::endl;
    return 0;
}
