#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

#if LEDCAST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using ledcast::db::ErrorCode;
using ledcast::db::Repository;
using ledcast::db::memory::MemoryRepository;
using ledcast::db::model::ArtifactRecord;
using ledcast::db::model::GeometryOutcomeRecord;
using ledcast::db::model::JobRecord;
using ledcast::db::model::SourceRecord;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

SourceRecord MakeSource(const std::string& id, const std::string& filename, uint64_t ingested_at_ms = 1000) {
  SourceRecord source;
  source.id             = id;
  source.filename       = filename;
  source.display_name   = std::filesystem::path(filename).stem().string();
  source.kind           = ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE;
  source.byte_size      = 4096;
  source.ingested_at_ms = ingested_at_ms;
  return source;
}

ArtifactRecord MakeArtifact(const std::string& source_id, const std::string& geometry) {
  ArtifactRecord artifact;
  artifact.source_id       = source_id;
  artifact.geometry        = geometry;
  artifact.encoder_version = "enc-1";
  artifact.path            = geometry + "/" + source_id + ".lcf";
  artifact.frame_count     = 12;
  artifact.byte_size       = 36864;
  artifact.loop            = true;
  artifact.created_at_ms   = 2000;
  return artifact;
}

void VerifySourceLifecycle(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.UpsertSource(*tx, MakeSource("bb01", "wave.gif", 1000)));
  assert(repo.UpsertSource(*tx, MakeSource("aa01", "fire.gif", 1500)));

  // refresh keeps the first ingest time
  assert(repo.UpsertSource(*tx, MakeSource("bb01", "renamed.gif", 9999)));
  const auto refreshed = repo.GetSource(*tx, "bb01");
  assert(refreshed.has_value());
  assert(refreshed->filename == "renamed.gif");
  assert(refreshed->display_name == "renamed");
  assert(refreshed->ingested_at_ms == 1000);
  assert(refreshed->kind == ledcast::v1::MEDIA_KIND_ANIMATED_IMAGE);

  const auto listed = repo.ListSources(*tx);
  assert(listed.size() == 2);
  assert(listed[0].id == "aa01");
  assert(listed[1].id == "bb01");

  assert(repo.DeleteSource(*tx, "aa01"));
  assert(repo.DeleteSource(*tx, "aa01").code == ErrorCode::NotFound);
  assert(!repo.GetSource(*tx, "aa01").has_value());

  tx->Commit();
}

void VerifyArtifactRows(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.UpsertArtifact(*tx, MakeArtifact("cc01", "32x32")).code == ErrorCode::ConstraintViolation);

  assert(repo.UpsertSource(*tx, MakeSource("cc01", "spin.gif")));
  assert(repo.UpsertArtifact(*tx, MakeArtifact("cc01", "32x32")));
  assert(repo.UpsertArtifact(*tx, MakeArtifact("cc01", "16x16")));

  assert(repo.TouchArtifact(*tx, "cc01", "32x32", "enc-1", 5000));
  assert(repo.TouchArtifact(*tx, "cc01", "32x32", "enc-1", 6000));
  assert(repo.TouchArtifact(*tx, "cc01", "32x32", "enc-2", 6000).code == ErrorCode::NotFound);

  // re-upsert keeps serve statistics
  auto replaced        = MakeArtifact("cc01", "32x32");
  replaced.frame_count = 20;
  replaced.loop        = false;
  assert(repo.UpsertArtifact(*tx, replaced));

  const auto read = repo.GetArtifact(*tx, "cc01", "32x32", "enc-1");
  assert(read.has_value());
  assert(read->frame_count == 20);
  assert(!read->loop);
  assert(read->served_count == 2);
  assert(read->last_served_ms == 6000);
  assert(read->byte_size == 36864);
  assert(read->path == "32x32/cc01.lcf");
  assert(!repo.GetArtifact(*tx, "cc01", "32x32", "enc-2").has_value());

  const auto for_source = repo.ListArtifactsForSource(*tx, "cc01");
  assert(for_source.size() == 2);
  assert(for_source[0].geometry == "16x16");
  assert(for_source[1].geometry == "32x32");

  assert(repo.DeleteArtifact(*tx, "cc01", "16x16", "enc-1"));
  assert(repo.DeleteArtifact(*tx, "cc01", "16x16", "enc-1").code == ErrorCode::NotFound);

  // artifacts cascade with their source
  assert(repo.DeleteSource(*tx, "cc01"));
  assert(repo.ListArtifactsForSource(*tx, "cc01").empty());

  tx->Commit();
}

void VerifyJobOutcomes(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertSource(*tx, MakeSource("dd01", "clip.mp4")));

  JobRecord job;
  job.source_id       = "dd01";
  job.state           = ledcast::v1::JOB_STATE_PARTIAL;
  job.attempts        = 1;
  job.last_error      = "53x11: capacity";
  job.encoder_version = "enc-1";
  job.updated_at_ms   = 7000;
  job.outcomes        = {GeometryOutcomeRecord{"32x32", true, ledcast::v1::ERROR_KIND_UNSPECIFIED, ""},
                         GeometryOutcomeRecord{"53x11", false, ledcast::v1::ERROR_KIND_CAPACITY, "capacity"}};
  assert(repo.UpsertJob(*tx, job));

  auto read = repo.GetJob(*tx, "dd01");
  assert(read.has_value());
  assert(read->state == ledcast::v1::JOB_STATE_PARTIAL);
  assert(read->last_error == "53x11: capacity");
  assert(read->outcomes.size() == 2);
  assert(read->outcomes[1].geometry == "53x11");
  assert(!read->outcomes[1].ok);
  assert(read->outcomes[1].error_kind == ledcast::v1::ERROR_KIND_CAPACITY);

  // outcomes are replaced as a whole
  job.state         = ledcast::v1::JOB_STATE_QUEUED;
  job.not_before_ms = 8000;
  job.outcomes      = {};
  assert(repo.UpsertJob(*tx, job));
  read = repo.GetJob(*tx, "dd01");
  assert(read->state == ledcast::v1::JOB_STATE_QUEUED);
  assert(read->not_before_ms == 8000);
  assert(read->outcomes.empty());

  assert(repo.ListJobs(*tx).size() == 1);
  assert(repo.DeleteJob(*tx, "dd01"));
  assert(repo.DeleteJob(*tx, "dd01").code == ErrorCode::NotFound);
  assert(repo.DeleteSource(*tx, "dd01"));

  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertSource(*tx, MakeSource("ee01", "gone.gif")));
    tx->Rollback();
  }
  {
    // destructor without commit rolls back too
    auto tx = repo.Begin();
    assert(repo.UpsertSource(*tx, MakeSource("ee02", "gone.gif")));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetSource(*check_tx, "ee01").has_value());
  assert(!repo.GetSource(*check_tx, "ee02").has_value());
  check_tx->Commit();
}

void VerifySerializedTransactions(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertSource(*tx, MakeSource("ff01", "count.gif")));
    JobRecord job;
    job.source_id = "ff01";
    assert(repo.UpsertJob(*tx, job));
    tx->Commit();
  }

  // read-modify-write from two threads loses no update
  auto bump = [&repo] {
    for (int i = 0; i < 25; ++i) {
      auto tx  = repo.Begin();
      auto job = repo.GetJob(*tx, "ff01");
      assert(job.has_value());
      job->attempts += 1;
      assert(repo.UpsertJob(*tx, *job));
      tx->Commit();
    }
  };
  std::thread a(bump);
  std::thread b(bump);
  a.join();
  b.join();

  auto tx = repo.Begin();
  assert(repo.GetJob(*tx, "ff01")->attempts == 50);
  assert(repo.DeleteJob(*tx, "ff01"));
  assert(repo.DeleteSource(*tx, "ff01"));
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertSource(*tx, MakeSource("ab01", "keep.gif")));
    assert(repo->UpsertArtifact(*tx, MakeArtifact("ab01", "32x32")));
    assert(repo->TouchArtifact(*tx, "ab01", "32x32", "enc-1", 4242));

    JobRecord job;
    job.source_id = "ab01";
    job.state     = ledcast::v1::JOB_STATE_SUCCEEDED;
    job.attempts  = 1;
    job.outcomes  = {GeometryOutcomeRecord{"32x32", true, ledcast::v1::ERROR_KIND_UNSPECIFIED, ""}};
    assert(repo->UpsertJob(*tx, job));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetSource(*tx, "ab01").has_value());
  const auto artifact = repo->GetArtifact(*tx, "ab01", "32x32", "enc-1");
  assert(artifact.has_value());
  assert(artifact->served_count == 1);
  assert(artifact->last_served_ms == 4242);
  const auto job = repo->GetJob(*tx, "ab01");
  assert(job.has_value());
  assert(job->state == ledcast::v1::JOB_STATE_SUCCEEDED);
  assert(job->outcomes.size() == 1);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if LEDCAST_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("ledcast_integration_sqlite_" + std::to_string(ledcast::util::NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<ledcast::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::static_pointer_cast<Repository>(std::make_shared<ledcast::db::sqlite::SqliteRepository>(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::error_code ec;
        std::filesystem::remove(db_path, ec);
        std::filesystem::remove(db_path + "-wal", ec);
        std::filesystem::remove(db_path + "-shm", ec);
      },
  };
}
#endif

void RunParitySuite(BackendFactory backend) {
  auto repo = backend.make_repository();
  VerifySourceLifecycle(*repo);
  VerifyArtifactRows(*repo);
  VerifyJobOutcomes(*repo);
  VerifyRollbackBehavior(*repo);
  VerifySerializedTransactions(*repo);
  repo.reset();

  VerifyRestartDurability(backend);
  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  RunParitySuite(MakeMemoryFactory());
#if LEDCAST_DB_SQLITE
  RunParitySuite(MakeSqliteFactory());
#endif

  std::cout << "ledcast_integration_repository_parity: pass\n";
  return 0;
}
