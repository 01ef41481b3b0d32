#include "worker.hpp"
#include <glog/logging.h>
#include <atomic>
#include "common/utils.hpp"

namespace ctf {
using namespace std;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

static void worker_loop(size_t worker_id, server::request_handler &handler,
                        concurrent_queue<request_task> &request_queue,
                        const function<void(const string &)> &emit) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    size_t processed = 0;

    while (!stop) {
        auto task = request_queue.pop();
        if (!task) break;  // 队列已关闭并且取空

        elapsed_time timer;
        string response = handler.handle_line(task->text);
        emit(response);
        ++processed;

        auto cost = timer.duration<chrono::milliseconds>().count();
        if (cost > 1000)
            LOG(WARNING) << "Worker " << worker_id << " took " << cost << "ms to handle request at line " << task->line_no;
    }

    DLOG(INFO) << "Worker " << worker_id << " stopped after " << processed << " requests";
}

thread start_worker(size_t worker_id, server::request_handler &handler,
                    concurrent_queue<request_task> &request_queue,
                    function<void(const string &)> emit) {
    return thread([worker_id, &handler, &request_queue, emit = move(emit)] {
        worker_loop(worker_id, handler, request_queue, emit);
    });
}

}  // namespace ctf
