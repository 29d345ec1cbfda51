#include "docparse/BackendRetryController.hpp"

#include "docparse/Geometry.hpp"
#include "docparse/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace docparse {

namespace {

const char *endpointName(Endpoint endpoint) {
  return endpoint == Endpoint::Default ? "default" : "large document";
}

std::string describe(const std::exception_ptr &error) {
  if (!error) {
    return "unknown error";
  }
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

/**
 * @brief Call one endpoint, capturing its result or its exception
 */
std::exception_ptr callEndpoint(DocumentAiBackend &backend, Endpoint endpoint,
                                const std::vector<char> &document,
                                std::optional<AnalyzeResult> &result,
                                BackendAttempt &attempt) {
  attempt.endpoint = endpoint;
  std::exception_ptr error;

  auto startTime = std::chrono::high_resolution_clock::now();
  try {
    result = endpoint == Endpoint::Default ? backend.analyzeDefault(document)
                                           : backend.analyzeLarge(document);
  } catch (...) {
    // Classified and logged by the caller
    error = std::current_exception();
  }
  auto endTime = std::chrono::high_resolution_clock::now();
  attempt.elapsedMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return error;
}

} // anonymous namespace

HttpResponseError::HttpResponseError(const std::string &message, int status)
    : BackendError(message), m_status(status) {}

int HttpResponseError::status() const { return m_status; }

FailureKind classifyFailure(const std::exception_ptr &error) noexcept {
  if (!error) {
    return FailureKind::Unclassified;
  }
  try {
    std::rethrow_exception(error);
  } catch (const HttpResponseError &) {
    return FailureKind::TransientOrSize;
  } catch (const ServiceRequestError &) {
    return FailureKind::CredentialOrService;
  } catch (...) {
    return FailureKind::Unclassified;
  }
}

std::string failureKindName(FailureKind kind) {
  switch (kind) {
  case FailureKind::TransientOrSize:
    return "transient/size";
  case FailureKind::CredentialOrService:
    return "credential/service";
  case FailureKind::Unclassified:
    return "unclassified";
  }
  return "unclassified";
}

std::string backendStateName(BackendState state) {
  switch (state) {
  case BackendState::NotStarted:
    return "NotStarted";
  case BackendState::TryingDefault:
    return "TryingDefault";
  case BackendState::TryingLarge:
    return "TryingLarge";
  case BackendState::Success:
    return "Success";
  case BackendState::Failed:
    return "Failed";
  }
  return "Failed";
}

BackendRetryController::BackendRetryController(DocumentAiBackend &backend)
    : m_backend(backend) {}

BackendState BackendRetryController::state() const { return m_state; }

bool BackendRetryController::isValidTransition(BackendState from,
                                               BackendState to) {
  switch (from) {
  case BackendState::NotStarted:
    return to == BackendState::TryingDefault;
  case BackendState::TryingDefault:
    return to == BackendState::Success || to == BackendState::TryingLarge ||
           to == BackendState::Failed;
  case BackendState::TryingLarge:
    return to == BackendState::Success || to == BackendState::Failed;
  case BackendState::Success:
  case BackendState::Failed:
    return false;
  }
  return false;
}

void BackendRetryController::transition(BackendState next) {
  if (!isValidTransition(m_state, next)) {
    throw std::logic_error("Invalid backend state transition: " +
                           backendStateName(m_state) + " -> " +
                           backendStateName(next));
  }
  m_state = next;
}

BackendOutcome
BackendRetryController::analyze(const std::string &documentId,
                                const std::vector<char> &document) {
  BackendOutcome outcome;
  m_state = BackendState::NotStarted;

  Endpoint endpoint = Endpoint::Default;
  transition(BackendState::TryingDefault);

  while (true) {
    BackendAttempt attempt;
    std::optional<AnalyzeResult> result;
    std::exception_ptr error =
        callEndpoint(m_backend, endpoint, document, result, attempt);

    if (!error) {
      attempt.outcome = BackendAttempt::Outcome::Success;
      outcome.attempts.push_back(attempt);
      transition(BackendState::Success);

      outcome.success = true;
      outcome.result = std::move(result);
      log(LogLevel::Info, "backend", documentId,
          std::string("Parsed document with the ") + endpointName(endpoint) +
              " endpoint: " + std::to_string(outcome.result->pages.size()) +
              " pages in " + std::to_string(attempt.elapsedMs) + " ms.");
      break;
    }

    FailureKind kind = classifyFailure(error);
    attempt.errorMessage = describe(error);
    attempt.outcome = kind == FailureKind::TransientOrSize
                          ? BackendAttempt::Outcome::RetryableError
                          : BackendAttempt::Outcome::FatalError;
    outcome.attempts.push_back(attempt);
    outcome.failure = kind;
    outcome.errorMessage = attempt.errorMessage;

    if (kind == FailureKind::TransientOrSize &&
        endpoint == Endpoint::Default) {
      log(LogLevel::Warning, "backend", documentId,
          "Failed to parse document with the default endpoint, retrying "
          "with the large document endpoint. Error: " +
              attempt.errorMessage);
      transition(BackendState::TryingLarge);
      endpoint = Endpoint::Large;
      continue;
    }

    switch (kind) {
    case FailureKind::TransientOrSize:
      log(LogLevel::Error, "backend", documentId,
          "Failed to parse document with the large document endpoint; no "
          "endpoint left to try. Error: " +
              attempt.errorMessage);
      break;
    case FailureKind::CredentialOrService:
      log(LogLevel::Error, "backend", documentId,
          std::string("Failed to parse document with the ") +
              endpointName(endpoint) +
              " endpoint. This is most likely due to incorrect credentials "
              "or an unreachable service; not retrying. Error: " +
              attempt.errorMessage);
      break;
    case FailureKind::Unclassified:
      log(LogLevel::Error, "backend", documentId,
          std::string("Unclassified failure calling the ") +
              endpointName(endpoint) +
              " endpoint; failing the document safely. Error: " +
              attempt.errorMessage);
      break;
    }

    transition(BackendState::Failed);
    break;
  }

  outcome.state = m_state;
  return outcome;
}

std::vector<TextBlock> toTextBlocks(const AnalyzedPage &page,
                                    double rowTolerance) {
  std::vector<Box> boxes;
  boxes.reserve(page.paragraphs.size());
  for (const auto &paragraph : page.paragraphs) {
    boxes.push_back(paragraph.box);
  }

  std::vector<TextBlock> blocks;
  std::size_t index = 0;
  for (std::size_t position : readingOrder(boxes, rowTolerance)) {
    const AnalyzedParagraph &paragraph = page.paragraphs[position];
    std::size_t blockIndex = index++;

    std::vector<std::string> lines = cleanLines(paragraph.lines);
    if (lines.empty()) {
      continue;
    }

    TextBlock block;
    block.text = std::move(lines);
    block.blockId = "p" + std::to_string(page.pageNumber) + "_b" +
                    std::to_string(blockIndex);
    block.type = (paragraph.role == "title" ||
                  paragraph.role == "sectionHeading")
                     ? BlockType::Title
                     : BlockType::Text;
    block.typeConfidence =
        std::clamp(paragraph.confidence.value_or(1.0), 0.0, 1.0);
    block.coords = toCorners(paragraph.box);
    block.pageNumber = page.pageNumber;
    blocks.push_back(std::move(block));
  }

  return blocks;
}

} // namespace docparse
