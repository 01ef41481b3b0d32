#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "model/challenge.hpp"

namespace ctf {

struct user {
    id_type id = 0;

    std::string name;

    /**
     * @brief 用户当前所在的队伍，为空表示个人参赛
     * 队伍关系不记录历史，用户换队后其所有解题记录都计入新队伍
     */
    std::optional<id_type> team_id;
};

void to_json(nlohmann::json &j, const user &u);
void from_json(const nlohmann::json &j, user &u);

/**
 * @brief 队伍
 * 队伍本身不保存成员列表，成员由用户的 team_id 推导
 */
struct team {
    id_type id = 0;

    std::string name;

    /**
     * @brief 队伍人数上限
     */
    int max_members = 4;

    id_type captain_id = 0;

    /**
     * @brief 队伍解散后变为 false，不再接受新成员
     */
    bool is_active = true;
};

void to_json(nlohmann::json &j, const team &t);
void from_json(const nlohmann::json &j, team &t);

}  // namespace ctf
