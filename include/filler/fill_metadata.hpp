#pragma once

#include "exchange/collaborators.hpp"
#include "exchange/types.hpp"

/**
 * Resolves the maker (account, stats, order), the taker account and the taker's
 * referrer for one candidate. Throws AccountNotFoundError (or whatever the
 * directory throws) when an account cannot be resolved.
 */
[[nodiscard]] FillMetadata resolve_fill_metadata(AccountDirectory& accounts,
                                                 const FillCandidate& candidate);
