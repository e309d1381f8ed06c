#include "dailyops/scheduler/retention_sweeper.hpp"

#include "dailyops/storage/store.hpp"
#include "dailyops/util/log.hpp"
#include "dailyops/util/util.hpp"

namespace dailyops {

namespace {

// Deletes each id on its own so one bad record does not stop the rest.
template <typename Id, typename Delete>
auto delete_each(const std::vector<Id>& ids, std::string_view kind,
                 Delete&& del, std::size_t& deleted, std::size_t& failed)
    -> void {
  for (const auto& id : ids) {
    auto r = del(id);
    if (!r) {
      log::warn("Deleting {} {} failed: {}", kind, id, r.error().message());
      ++failed;
    } else if (*r) {
      ++deleted;
    }
  }
}

}  // namespace

RetentionSweeper::RetentionSweeper(Store& store, const Clock& clock)
    : store_(store), clock_(clock) {
}

auto RetentionSweeper::sweep(int horizon_days) -> Result<CleanupReport> {
  if (horizon_days <= 0) {
    log::error("Retention horizon must be positive, got {}", horizon_days);
    return fail(Error::InvalidArgument);
  }

  auto cutoff = clock_.now() - std::chrono::days{horizon_days};
  log::info("Retention sweep: removing history older than {}",
            format_timestamp(cutoff));

  auto instances = store_.list_expired_instances(cutoff);
  if (!instances)
    return fail(instances.error());
  auto sessions = store_.list_expired_sessions(cutoff);
  if (!sessions)
    return fail(sessions.error());

  CleanupReport report;
  delete_each(
      *instances, "instance",
      [this](const InstanceId& id) { return store_.delete_completed_instance(id); },
      report.deleted_instances, report.failed);
  delete_each(
      *sessions, "session",
      [this](const SessionId& id) { return store_.delete_closed_session(id); },
      report.deleted_sessions, report.failed);

  // Orphans are listed after the instance pass; completions themselves are
  // owned by the completion workflow, not by this sweep.
  auto orphans = store_.list_orphaned_attachments();
  if (!orphans)
    return fail(orphans.error());
  delete_each(
      *orphans, "attachment",
      [this](const AttachmentId& id) { return store_.delete_attachment(id); },
      report.deleted_orphaned_attachments, report.failed);

  log::info("Retention sweep: {} instances, {} sessions, {} orphaned "
            "attachments deleted, {} failed",
            report.deleted_instances, report.deleted_sessions,
            report.deleted_orphaned_attachments, report.failed);
  return report;
}

}  // namespace dailyops
