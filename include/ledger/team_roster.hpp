#pragma once

#include <functional>
#include <optional>
#include <vector>
#include "common/status.hpp"
#include "model/team.hpp"
#include "store/ledger_store.hpp"

namespace ctf::ledger {

/**
 * @brief 用户和队伍管理
 *
 * 队伍关系不记录历史：用户加入或转入一个队伍后，他所有的解题记录
 * （包括加入之前的）都计入新队伍的分数。
 *
 * 所有改变成员关系的操作都锁定涉及的用户以及原队伍和目标队伍，
 * 人数检查与写入成员关系在同一个事务内完成，因此并发加入时队伍人数不会超过上限，
 * 同一个用户也不会同时加入两个队伍。
 */
struct team_roster {
    explicit team_roster(store::ledger_store &store);

    /**
     * @brief 新建或者更新一个用户的名称，不会修改用户所在的队伍
     * @throws validation_error 如果用户名为空
     */
    void register_user(const user &u);

    /**
     * @brief 新建队伍，队长自动成为第一个成员
     * @return INVALID_TEAM 如果名称少于 2 个字符、人数上限不在 1 到 10 之间，或者 id 已被占用
     */
    roster_status create_team(const team &t);

    roster_status join(id_type user_id, id_type team_id);

    /**
     * @brief 将用户从当前队伍转入另一个队伍
     * 用户原来的解题记录随之计入新队伍
     */
    roster_status transfer(id_type user_id, id_type team_id);

    /**
     * @brief 离开当前队伍
     * 队伍还有其他成员时队长不能离队；最后一个成员离队后队伍变为不活跃
     */
    roster_status leave(id_type user_id);

    roster_status transfer_captain(id_type team_id, id_type actor_id, id_type new_captain_id);

    /**
     * @brief 解散队伍，只有队长可以执行
     * 所有成员变为个人参赛，队伍变为不活跃
     */
    roster_status disband(id_type team_id, id_type actor_id);

    /**
     * @brief 注册一个回调，在成员关系或者队伍信息变更之后调用
     */
    void on_changed(std::function<void()> callback);

private:
    /**
     * @brief 在锁定用户、目标队伍和原队伍的事务内检查并写入成员关系
     * @param from 用户应当所在的原队伍，为空表示用户应当没有队伍
     */
    roster_status move_member(id_type user_id, id_type team_id, std::optional<id_type> from);

    void notify_changed();

    store::ledger_store &store;
    std::vector<std::function<void()>> callbacks;
};

}  // namespace ctf::ledger
