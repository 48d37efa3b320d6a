#include <peek/app/orchestrator.hpp>
#include <peek/app/analyzer_runner.hpp>
#include <peek/core/logging.hpp>
#include <peek/vision/decode_image.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <span>
#include <variant>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace peek::app {

using peek::core::Error;
using peek::core::ErrorCode;
using peek::core::JobStatus;
using peek::store::Completion;

namespace {

/// Shared between run() and the helper thread.
struct JobState {
  std::mutex mutex;
  bool cancelled{false};
  std::optional<std::string> stored_annotation;
};

struct Collaborators {
  std::shared_ptr<peek::storage::IStorageBackend> storage;
  std::shared_ptr<const peek::core::AnalyzerSet> analyzers;
  std::shared_ptr<const peek::vision::AnnotationRenderer> renderer;
  bool parallel{true};
};

/// Stores the rendered annotation unless run() has already given up on the
/// job. The key is recorded in `state` so run() can remove it on timeout.
void store_annotation(const Collaborators& c,
                      const std::string& job_id,
                      const std::string& original_key,
                      const peek::vision::RenderedAnnotation& rendered,
                      JobState& state) {
  {
    std::lock_guard lock(state.mutex);
    if (state.cancelled) return;
  }
  auto key = c.renderer->store(original_key, rendered);
  if (!key) {
    peek::core::logger()->warn("job {}: annotation not stored: {}", job_id, key.error().message);
    return;
  }

  std::lock_guard lock(state.mutex);
  if (state.cancelled) {
    // run() already gave up on this job; do not leave the late artifact behind.
    if (auto removed = c.storage->remove(*key); !removed) {
      peek::core::logger()->warn("job {}: late annotation {} not removed: {}", job_id, *key,
                                 removed.error().message);
    }
    return;
  }
  state.stored_annotation = std::move(*key);
}

void annotate(const Collaborators& c,
              const std::string& job_id,
              const std::string& original_key,
              std::span<const std::byte> original,
              const peek::core::FaceResult& faces,
              JobState& state) {
  auto rendered = c.renderer->render(original, faces.face_locations);
  if (!rendered) {
    peek::core::logger()->warn("job {}: annotation failed: {}", job_id, rendered.error().message);
  } else if (*rendered) {
    store_annotation(c, job_id, original_key, **rendered, state);
  }
}

std::expected<Completion, Error> process(const Collaborators& c,
                                         const std::string& job_id,
                                         const std::string& original_key,
                                         JobState& state) {
  auto original = c.storage->fetch(original_key);
  if (!original) {
    return std::unexpected(Error{ErrorCode::StorageError, original.error().message});
  }

  auto image = peek::vision::decode_image(*original);
  if (!image) return std::unexpected(image.error());

  peek::core::AnalyzerTimingCallback timing = [&job_id](peek::core::AnalyzerKind kind, double ms) {
    peek::core::logger()->debug("job {}: {} analyzer took {:.1f} ms", job_id,
                                peek::core::to_string(kind), ms);
  };
  // The annotation only needs the face output, so it is rendered as soon as
  // that is ready, while the other analyzers are still running.
  AnalyzerResultCallback on_result =
      [&](peek::core::AnalyzerKind kind,
          const std::expected<peek::core::PartialResult, Error>& outcome) {
        if (kind != peek::core::AnalyzerKind::Face || !c.renderer || !outcome) return;
        if (const auto* faces = std::get_if<peek::core::FaceResult>(&*outcome)) {
          annotate(c, job_id, original_key, *original, *faces, state);
        }
      };
  auto outcomes = run_analyzers(*c.analyzers, *image, c.parallel, &timing, &on_result);
  for (std::size_t i = 0; i < outcomes.size(); ++i) {
    if (!outcomes[i]) {
      peek::core::logger()->warn("job {}: {} analyzer failed: {}", job_id,
                                 peek::core::to_string(static_cast<peek::core::AnalyzerKind>(i)),
                                 outcomes[i].error().message);
    }
  }

  // Every analyzer failing includes the face analyzer, so no annotation exists then.
  auto aggregated = peek::core::aggregate(std::move(outcomes));
  if (!aggregated) return std::unexpected(aggregated.error());

  Completion completion;
  {
    std::lock_guard lock(state.mutex);
    completion.annotated_key = state.stored_annotation;
  }
  completion.insights = std::move(aggregated->insights);
  completion.failed_analyzers = std::move(aggregated->failed_analyzers);
  completion.width = image->width();
  completion.height = image->height();
  return completion;
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

Orchestrator::Orchestrator(std::shared_ptr<peek::storage::IStorageBackend> storage,
                           std::shared_ptr<peek::store::IResultStore> store,
                           std::shared_ptr<const peek::core::AnalyzerSet> analyzers,
                           std::shared_ptr<const peek::vision::AnnotationRenderer> renderer,
                           OrchestratorOptions options)
    : storage_(std::move(storage)),
      store_(std::move(store)),
      analyzers_(std::move(analyzers)),
      renderer_(std::move(renderer)),
      options_(options) {
  if (!storage_ || !store_ || !analyzers_) {
    throw std::invalid_argument("Orchestrator: storage, store and analyzers are required");
  }
}

std::string_view Orchestrator::failure_reason(const Error& error) noexcept {
  switch (error.code) {
    case ErrorCode::DecodeError:
      return "decode_error";
    case ErrorCode::Timeout:
      return "timeout";
    case ErrorCode::StorageError:
    case ErrorCode::NotFound:
      return "storage_error";
    default:
      return "pipeline_error";
  }
}

std::expected<JobStatus, Error> Orchestrator::run(const std::string& job_id) {
  auto record = store_->get(job_id);
  if (!record) {
    peek::core::logger()->error("job {}: cannot load record: {}", job_id, record.error().message);
    return std::unexpected(record.error());
  }
  if (record->terminal()) {
    peek::core::logger()->debug("job {}: already {}, skipping", job_id,
                                peek::core::to_string(record->status));
    return record->status;
  }

  try {
    return execute(*record);
  } catch (const std::exception& e) {
    peek::core::logger()->error("job {}: unexpected failure: {}", job_id, e.what());
    return finish_failed(job_id, Error{ErrorCode::PipelineError, e.what()}, 0);
  }
}

std::expected<JobStatus, Error> Orchestrator::execute(const peek::core::InsightRecord& record) {
  const std::string& job_id = record.id;
  const auto start = std::chrono::steady_clock::now();
  const auto deadline = start + options_.job_timeout;
  peek::core::logger()->info("job {}: processing {}", job_id, record.asset.original_key);

  auto state = std::make_shared<JobState>();
  std::promise<std::expected<Completion, Error>> promise;
  auto future = promise.get_future();

  Collaborators collab{storage_, analyzers_, renderer_, options_.parallel_analyzers};
  std::thread worker([collab = std::move(collab), job_id, key = record.asset.original_key, state,
                      promise = std::move(promise)]() mutable {
    try {
      promise.set_value(process(collab, job_id, key, *state));
    } catch (const std::exception& e) {
      promise.set_value(std::unexpected(Error{ErrorCode::PipelineError, e.what()}));
    }
  });

  if (future.wait_until(deadline) != std::future_status::ready) {
    std::optional<std::string> orphan;
    {
      std::lock_guard lock(state->mutex);
      state->cancelled = true;
      orphan = std::move(state->stored_annotation);
    }
    worker.detach();
    if (orphan) {
      if (auto removed = storage_->remove(*orphan); !removed) {
        peek::core::logger()->warn("job {}: annotation {} not removed: {}", job_id, *orphan,
                                   removed.error().message);
      }
    }
    return finish_failed(job_id, Error{ErrorCode::Timeout, "job exceeded its time budget"},
                         elapsed_ms(start));
  }
  worker.join();

  auto completion = future.get();
  if (!completion) return finish_failed(job_id, completion.error(), elapsed_ms(start));

  completion->processing_time_ms = elapsed_ms(start);
  auto written = store_->complete(job_id, *completion, peek::store::now_ms());
  if (!written) {
    if (completion->annotated_key) {
      if (auto removed = storage_->remove(*completion->annotated_key); !removed) {
        peek::core::logger()->warn("job {}: annotation {} not removed: {}", job_id,
                                   *completion->annotated_key, removed.error().message);
      }
    }
    if (written.error() == ErrorCode::AlreadyTerminal) {
      peek::core::logger()->warn("job {}: already terminal, result discarded", job_id);
      auto current = store_->get(job_id);
      if (!current) return std::unexpected(current.error());
      return current->status;
    }
    peek::core::logger()->error("job {}: cannot write result: {}", job_id, written.error().message);
    return finish_failed(job_id, written.error(), completion->processing_time_ms);
  }

  peek::core::logger()->info("job {}: completed in {} ms ({} faces, {} analyzer(s) failed)", job_id,
                             completion->processing_time_ms,
                             completion->insights.faces_detected(),
                             completion->failed_analyzers.size());
  return JobStatus::Completed;
}

std::expected<JobStatus, Error> Orchestrator::finish_failed(const std::string& job_id,
                                                            const Error& error,
                                                            std::int64_t elapsed) {
  const std::string_view reason = failure_reason(error);
  peek::core::logger()->error("job {}: failed ({}): {}", job_id, reason, error.message);

  auto written = store_->fail(job_id, reason, elapsed, peek::store::now_ms());
  if (!written) {
    if (written.error() == ErrorCode::AlreadyTerminal) {
      auto current = store_->get(job_id);
      if (!current) return std::unexpected(current.error());
      return current->status;
    }
    return std::unexpected(written.error());
  }
  return JobStatus::Failed;
}

}  // namespace peek::app
