#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "config.hpp"
#include "ledger/scoring.hpp"
#include "model/submission.hpp"
#include "store/ledger_store.hpp"

namespace ctf::ledger {

/**
 * @brief 提交账本
 * 负责一次 flag 提交的完整处理过程：校验、判定、计分、写入。
 *
 * 对同一道题目的提交在存储后端的串行化点内执行以下步骤：
 * 1. 检查题目存在且已上线，否则 CHALLENGE_UNAVAILABLE；
 * 2. 检查提交次数上限，否则 ATTEMPT_LIMIT_EXCEEDED；
 * 3. 检查用户尚未解出该题，否则 ALREADY_SOLVED；
 * 4. 判定 flag，读取已有解题数并计分，写入提交记录。
 * 这些步骤要么全部生效，要么全部不生效。
 *
 * 因为已有解题数的读取和写入在同一个串行化区间内，所以同一道题的
 * 正确提交按写入顺序依次获得第 1, 2, 3... 名，不会有两个一血。
 */
struct submission_ledger {
    submission_ledger(store::ledger_store &store, const scoring_engine &scoring, const ledger_config &config);

    /**
     * @brief 处理一次 flag 提交
     * 遇到 concurrency_conflict 时会重新执行整个事务，最多执行 ledger_config::submit_retries 次
     * @param user_id 提交者
     * @param challenge_id 题目
     * @param raw_flag 选手提交的原始文本
     * @param meta 提交者的网络信息
     * @throws concurrency_conflict 如果重试次数用尽
     * @throws storage_error 如果存储后端不可用，此时账本没有被修改
     */
    submission_result submit(id_type user_id, id_type challenge_id, const std::string &raw_flag, const client_meta &meta = {});

    /**
     * @brief 注册一个回调，在每条提交记录写入账本之后调用
     * 回调在事务之外执行，用于让读缓存失效
     */
    void on_recorded(std::function<void(const submission &)> callback);

private:
    submission_result submit_once(id_type user_id, id_type challenge_id, const std::string &raw_flag, const client_meta &meta);

    void notify_recorded(const submission &row);

    store::ledger_store &store;
    const scoring_engine &scoring;
    ledger_config config;

    std::mutex callback_mutex;
    std::vector<std::function<void(const submission &)>> callbacks;
};

}  // namespace ctf::ledger
