#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <thread>
#include <tuple>
#include <vector>

#include <warden/config.hxx>
#include <warden/guarded.hxx>
#include <warden/locks.hxx>
#include <warden/log.h>

using namespace std;
using namespace std::chrono;
using namespace warden;

/*
 * A few producers fill a shared queue of orders; a single courier takes
 * them out in batches of up to TRUNK_SIZE.
 *
 * - the queue is a guarded<deque>, instrumented so that contention on it
 *   can be reported at the end.
 * - the courier sleeps on a condition variable through its accessor;
 *   the lock of the queue is released while it waits.
 * - the number of delivered orders is a separate guarded counter
 *   updated with apply.
 *
 * Run with WARDEN_LOG_LEVEL=debug to see every step.
 */

namespace {

constexpr unsigned NUM_PRODUCERS = 4;
constexpr unsigned ORDERS_PER_PRODUCER = 25;
constexpr size_t TRUNK_SIZE = 10;

struct order {
    unsigned producer;
    unsigned seqno;
};

struct order_queue {
    deque<order> orders;
    unsigned open_producers = NUM_PRODUCERS;
};

}  // namespace

int main(int, char **) {
    config::init();

    lock_monitor monitor("order queue");
    guarded<order_queue, instrumented<mutex>> queue(
      piecewise_construct, forward_as_tuple(), forward_as_tuple(monitor));
    guarded<uint64_t> delivered;
    condition_variable_any orders_ready;

    vector<thread> producers;
    for (unsigned id = 0; id < NUM_PRODUCERS; ++id) {
        producers.emplace_back([&, id] {
            for (unsigned n = 0; n < ORDERS_PER_PRODUCER; ++n) {
                this_thread::sleep_for(milliseconds(1 + (id * 7 + n) % 5));

                queue.apply([&](order_queue &q) {
                    q.orders.push_back(order {id, n});
                });
                log_debug("producer %u: placed order %u", id, n);
                orders_ready.notify_one();
            }

            queue.apply([](order_queue &q) {
                --q.open_producers;
            });
            orders_ready.notify_one();
            log_info("producer %u: closed", id);
        });
    }

    thread courier([&] {
        for (;;) {
            vector<order> trunk;

            {
                auto q = queue.lock();
                q.wait(orders_ready, [](const order_queue &pending) {
                    return pending.orders.size() >= TRUNK_SIZE ||
                           pending.open_producers == 0;
                });

                if (q->orders.empty() && q->open_producers == 0) {
                    return;
                }

                while (!q->orders.empty() && trunk.size() < TRUNK_SIZE) {
                    trunk.push_back(q->orders.front());
                    q->orders.pop_front();
                }
            }

            // deliver without holding the queue
            for (const auto &o : trunk) {
                this_thread::sleep_for(microseconds(200));
                log_debug("courier: delivered order %u from producer %u",
                          o.seqno,
                          o.producer);
            }

            auto total = delivered.apply([n = trunk.size()](uint64_t &d) {
                d += n;
                return d;
            });
            log_info("courier: delivered a batch of %zu (total %llu)",
                     trunk.size(),
                     static_cast<unsigned long long>(total));
        }
    });

    for (auto &p : producers) {
        p.join();
    }
    courier.join();

    monitor.report();

    auto total = delivered.copy();
    if (total != NUM_PRODUCERS * ORDERS_PER_PRODUCER) {
        log_error("lost orders: delivered %llu of %u",
                  static_cast<unsigned long long>(total),
                  NUM_PRODUCERS * ORDERS_PER_PRODUCER);
        return 1;
    }

    log_info("all %llu orders delivered", static_cast<unsigned long long>(total));
    return 0;
}
