#ifndef DOCPARSE_BACKEND_RETRY_CONTROLLER_HPP
#define DOCPARSE_BACKEND_RETRY_CONTROLLER_HPP

#include "docparse/Types.hpp"

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docparse {

/**
 * @brief Base class for errors raised by a document-AI backend client
 */
class BackendError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief The service answered, but the response was unusable
 *
 * Raised for malformed responses and for documents exceeding the endpoint's
 * size or page limits. Another endpoint may succeed.
 */
class HttpResponseError : public BackendError {
public:
  explicit HttpResponseError(const std::string &message, int status = 0);

  int status() const;

private:
  int m_status;
};

/**
 * @brief The request never reached the service or was refused
 *
 * Raised for authentication failures and refused connections. Retrying
 * cannot help.
 */
class ServiceRequestError : public BackendError {
public:
  using BackendError::BackendError;
};

/**
 * @brief What a failure means for the document
 */
enum class FailureKind {
  TransientOrSize,     ///< Escalating to the other endpoint may help
  CredentialOrService, ///< Retrying never helps
  Unclassified         ///< Unknown; handled like CredentialOrService
};

/**
 * @brief Map a backend failure to its kind
 *
 * Pure function of the exception's dynamic type. A null pointer is
 * Unclassified.
 */
FailureKind classifyFailure(const std::exception_ptr &error) noexcept;

std::string failureKindName(FailureKind kind);

/**
 * @brief One paragraph as returned by the backend
 */
struct AnalyzedParagraph {
  Box box;                          ///< Page-pixel rectangle
  std::string role;                 ///< e.g. "title", "sectionHeading", ""
  std::vector<std::string> lines;   ///< Recognized text
  std::optional<double> confidence; ///< Missing for most backends
};

struct AnalyzedPage {
  int pageNumber = 0; ///< 0-indexed
  double width = 0.0;
  double height = 0.0;
  std::vector<AnalyzedParagraph> paragraphs;
};

/**
 * @brief Layout and text of a whole document
 */
struct AnalyzeResult {
  std::vector<AnalyzedPage> pages;
};

/**
 * @brief External document-AI service with two endpoints
 *
 * Both calls block until the service answers and may throw
 * HttpResponseError, ServiceRequestError or any other exception.
 */
class DocumentAiBackend {
public:
  virtual ~DocumentAiBackend() = default;

  /// Fast endpoint with tight size limits
  virtual AnalyzeResult analyzeDefault(const std::vector<char> &document) = 0;

  /// Slower endpoint for large documents
  virtual AnalyzeResult analyzeLarge(const std::vector<char> &document) = 0;
};

enum class Endpoint { Default, Large };

enum class BackendState {
  NotStarted,
  TryingDefault,
  TryingLarge,
  Success,
  Failed
};

std::string backendStateName(BackendState state);

/**
 * @brief Record of one endpoint call
 */
struct BackendAttempt {
  enum class Outcome { Success, RetryableError, FatalError };

  Endpoint endpoint = Endpoint::Default;
  Outcome outcome = Outcome::Success;
  double elapsedMs = 0.0;
  std::string errorMessage; ///< Empty on success
};

/**
 * @brief Result of analysing one document through the backend
 */
struct BackendOutcome {
  bool success = false;
  BackendState state = BackendState::NotStarted; ///< Final state
  std::optional<AnalyzeResult> result;           ///< Set on success
  std::vector<BackendAttempt> attempts;          ///< At most two
  std::optional<FailureKind> failure;            ///< Set on failure
  std::string errorMessage;
};

/**
 * @brief Calls the backend for a document and decides on escalation
 *
 * State machine per document:
 * - NotStarted -> TryingDefault
 * - TryingDefault -> Success | TryingLarge | Failed
 * - TryingLarge -> Success | Failed
 *
 * Only a TransientOrSize failure of the default endpoint escalates to the
 * large endpoint. Each endpoint is called at most once per document. No
 * backend error escapes analyze().
 */
class BackendRetryController {
public:
  /**
   * @param backend Backend client, borrowed for the controller's lifetime
   */
  explicit BackendRetryController(DocumentAiBackend &backend);

  /**
   * @brief Analyze one document, escalating at most once
   * @param documentId Id used in log messages
   * @param document Document bytes
   */
  BackendOutcome analyze(const std::string &documentId,
                         const std::vector<char> &document);

  /**
   * @brief State reached by the most recent analyze() call
   */
  BackendState state() const;

  /**
   * @brief Whether the state machine allows moving from one state to another
   */
  static bool isValidTransition(BackendState from, BackendState to);

private:
  void transition(BackendState next);

  DocumentAiBackend &m_backend;
  BackendState m_state = BackendState::NotStarted;
};

/**
 * @brief Convert one analysed page into text blocks
 *
 * "title" and "sectionHeading" paragraphs become Title blocks, all others
 * Text. Paragraphs without text are dropped; the rest are put into reading
 * order and numbered "p{page}_b{index}".
 *
 * @param page Page returned by the backend
 * @param rowTolerance Reading-order row tolerance in pixels
 */
std::vector<TextBlock> toTextBlocks(const AnalyzedPage &page,
                                    double rowTolerance = 5.0);

} // namespace docparse

#endif // DOCPARSE_BACKEND_RETRY_CONTROLLER_HPP
