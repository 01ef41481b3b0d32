#pragma once

#include <functional>
#include <optional>
#include <vector>
#include "model/challenge.hpp"
#include "store/ledger_store.hpp"

namespace ctf::ledger {

/**
 * @brief 题目目录，管理端通过它维护题目
 */
struct challenge_catalog {
    explicit challenge_catalog(store::ledger_store &store);

    std::optional<challenge> get(id_type challenge_id);

    /**
     * @brief 列出题目，按 id 升序
     * @param active_only 为真时只列出已上线的题目
     */
    std::vector<challenge> list(bool active_only = false);

    /**
     * @brief 新建或者覆盖一道题目
     * @throws validation_error 如果分值或提交次数上限为负数，名称或 flag 为空
     */
    void save(const challenge &c);

    /**
     * @brief 下线题目，已有提交的得分不受影响
     * @return 题目是否存在
     */
    bool deactivate(id_type challenge_id);

    /**
     * @brief 注册一个回调，在题目被修改之后调用
     */
    void on_changed(std::function<void(id_type)> callback);

private:
    store::ledger_store &store;
    std::vector<std::function<void(id_type)>> callbacks;
};

}  // namespace ctf::ledger
