#include "filler/fill_metadata.hpp"
#include "filler/errors.hpp"

FillMetadata resolve_fill_metadata(AccountDirectory& accounts,
                                   const FillCandidate& candidate) {
    if (!candidate.node || !candidate.node->user_account) {
        throw AccountNotFoundError("candidate without user account");
    }

    FillMetadata metadata;

    if (candidate.maker_node && candidate.maker_node->user_account) {
        const PublicKey& maker_account = *candidate.maker_node->user_account;
        UserAccount maker = accounts.must_get_user(maker_account);
        UserStats maker_stats = accounts.must_get_user_stats(maker.authority);
        metadata.maker_info = MakerInfo{.maker = maker_account,
                                        .maker_stats = maker_stats.user_stats,
                                        .order = candidate.maker_node->order};
    }

    metadata.taker = accounts.must_get_user(*candidate.node->user_account);
    UserStats taker_stats = accounts.must_get_user_stats(metadata.taker.authority);
    metadata.taker_stats = taker_stats.user_stats;
    metadata.referrer_info = taker_stats.referrer;

    return metadata;
}
