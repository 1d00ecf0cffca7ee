#pragma once

#include "config/configs.hpp"
#include "exchange/collaborators.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

/**
 * User accounts and stats held in memory. Nothing is visible until
 * fetch_all() loads the configured users, matching a directory that has to be
 * populated from the ledger at startup.
 *
 * The paper ledger writes fills back through apply_fill().
 */
class PaperAccountDirectory : public AccountDirectory {
public:
    explicit PaperAccountDirectory(std::vector<PaperUserConfig> users);

    void fetch_all() override;
    [[nodiscard]] UserAccount must_get_user(const PublicKey& user_account) override;
    [[nodiscard]] UserStats must_get_user_stats(const PublicKey& authority) override;
    void update_with_order(const OrderRecord& record) override;
    void ensure_authority(const PublicKey& authority) override;
    [[nodiscard]] std::vector<UserAccount> users() const override;

    [[nodiscard]] std::optional<Order> find_order(const PublicKey& user_account,
                                                  OrderID order_id) const;

    // Adds `amount` to the order's filled size, capped at its full size. A
    // fully filled order is closed. Returns the amount actually applied.
    Quantity apply_fill(const PublicKey& user_account, OrderID order_id, Quantity amount);

    [[nodiscard]] std::optional<PublicKey> authority_of(const PublicKey& user_account) const;

private:
    std::vector<PaperUserConfig> seed_;

    mutable std::mutex mutex_;
    std::unordered_map<PublicKey, UserAccount> users_;      // by user account
    std::unordered_map<PublicKey, UserStats> user_stats_;   // by authority

    static PublicKey default_stats_key_(const PublicKey& authority) {
        return authority + "-stats";
    }
};
