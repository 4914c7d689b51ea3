#pragma once

#include <chronicle/anchor/context.hpp>
#include <chronicle/schema/fsck_report.hpp>

namespace chronicle::anchor {

/// On-demand consistency pass over the digest and batch keyspaces.
///
/// Recomputes every batch root from its members, checks both directions of
/// the digest/batch link, reports pending digests that outlived
/// `stuck_multiple` flush periods and, when asked, advances confirmations
/// from the ledger. Confirmation state is the only thing it writes.
class reconciler final {
 public:
  explicit reconciler(context& ctx);

  chronicle::schema::fsck_report_t run(
      const chronicle::schema::fsck_options& options);

 private:
  context& context_;
};

}  // namespace chronicle::anchor
