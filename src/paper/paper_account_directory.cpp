#include "paper/paper_account_directory.hpp"
#include "filler/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

PaperAccountDirectory::PaperAccountDirectory(std::vector<PaperUserConfig> users)
    : seed_(std::move(users)) {}

void PaperAccountDirectory::fetch_all() {
    std::lock_guard lock(mutex_);
    for (const auto& user : seed_) {
        users_.try_emplace(user.user_account, UserAccount{.user_account = user.user_account,
                                                          .authority = user.authority,
                                                          .orders = user.orders});
        user_stats_.try_emplace(user.authority, UserStats{.authority = user.authority,
                                                          .user_stats = user.user_stats,
                                                          .referrer = user.referrer});
    }
    spdlog::debug("paper directory loaded {} users", users_.size());
}

UserAccount PaperAccountDirectory::must_get_user(const PublicKey& user_account) {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_account);
    if (it == users_.end()) {
        throw AccountNotFoundError(user_account);
    }
    return it->second;
}

UserStats PaperAccountDirectory::must_get_user_stats(const PublicKey& authority) {
    std::lock_guard lock(mutex_);
    auto it = user_stats_.find(authority);
    if (it == user_stats_.end()) {
        throw AccountNotFoundError(authority);
    }
    return it->second;
}

void PaperAccountDirectory::update_with_order(const OrderRecord& record) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = users_.try_emplace(
        record.user_account,
        UserAccount{.user_account = record.user_account, .authority = record.authority,
                    .orders = {}});
    if (inserted) {
        user_stats_.try_emplace(record.authority,
                                UserStats{.authority = record.authority,
                                          .user_stats = default_stats_key_(record.authority),
                                          .referrer = std::nullopt});
    }

    auto& orders = it->second.orders;
    auto existing = std::ranges::find_if(
        orders, [&](const Order& o) { return o.order_id == record.order.order_id; });
    if (existing != orders.end()) {
        *existing = record.order;
    } else {
        orders.push_back(record.order);
    }
}

void PaperAccountDirectory::ensure_authority(const PublicKey& authority) {
    std::lock_guard lock(mutex_);
    user_stats_.try_emplace(authority, UserStats{.authority = authority,
                                                 .user_stats = default_stats_key_(authority),
                                                 .referrer = std::nullopt});
}

std::vector<UserAccount> PaperAccountDirectory::users() const {
    std::lock_guard lock(mutex_);
    std::vector<UserAccount> out;
    out.reserve(users_.size());
    for (const auto& [key, user] : users_) {
        out.push_back(user);
    }
    // stable order keeps snapshot sequencing deterministic
    std::ranges::sort(out, {}, &UserAccount::user_account);
    return out;
}

std::optional<Order> PaperAccountDirectory::find_order(const PublicKey& user_account,
                                                       OrderID order_id) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_account);
    if (it == users_.end()) {
        return std::nullopt;
    }
    auto order = std::ranges::find_if(
        it->second.orders, [&](const Order& o) { return o.order_id == order_id; });
    if (order == it->second.orders.end()) {
        return std::nullopt;
    }
    return *order;
}

Quantity PaperAccountDirectory::apply_fill(const PublicKey& user_account, OrderID order_id,
                                           Quantity amount) {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_account);
    if (it == users_.end()) {
        return Quantity{0};
    }

    auto& orders = it->second.orders;
    auto order = std::ranges::find_if(orders,
                                      [&](const Order& o) { return o.order_id == order_id; });
    if (order == orders.end()) {
        return Quantity{0};
    }

    Quantity open = order->base_asset_amount_filled < order->base_asset_amount
                        ? order->base_asset_amount - order->base_asset_amount_filled
                        : Quantity{0};
    Quantity applied = std::min(open, amount);
    order->base_asset_amount_filled += applied;

    if (order->base_asset_amount_filled >= order->base_asset_amount) {
        orders.erase(order);
    }
    return applied;
}

std::optional<PublicKey> PaperAccountDirectory::authority_of(const PublicKey& user_account) const {
    std::lock_guard lock(mutex_);
    auto it = users_.find(user_account);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second.authority;
}
