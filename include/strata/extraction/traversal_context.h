#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <strata/extraction/element_record.h>

namespace strata::extraction {

/**
 * @brief An open construct that can contain further elements
 */
struct ScopeFrame {
    ElementType type;
    std::string name;

    /// "Type:Name", the unit parent paths are built from; slashes and backslashes in the
    /// name are escaped with a backslash
    [[nodiscard]] std::string label() const;
};

class TraversalContext;

/**
 * @brief Pops the frame it was created for when it goes out of scope
 */
class ScopeGuard {
public:
    explicit ScopeGuard(TraversalContext& ctx) : ctx_(&ctx) {}
    ~ScopeGuard();

    ScopeGuard(const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;
    ScopeGuard(ScopeGuard&& other) noexcept : ctx_(other.ctx_) { other.ctx_ = nullptr; }
    ScopeGuard& operator=(ScopeGuard&&) = delete;

private:
    TraversalContext* ctx_;
};

/**
 * @brief Per-file traversal state
 *
 * Created on the stack of each processFile call and passed by reference through the
 * recursive visit functions, so processors carry no traversal state between files.
 *
 * emit() assigns the next order number and records the scope depth and parent path as they
 * stand at the moment of discovery; a construct that opens a scope is emitted first and
 * then entered.
 */
class TraversalContext {
public:
    explicit TraversalContext(std::string filepath);

    TraversalContext(const TraversalContext&) = delete;
    TraversalContext& operator=(const TraversalContext&) = delete;

    /**
     * @brief Turn an element into a record placed under the current scope stack
     */
    const ElementRecord& emit(Element element);

    void push(ElementType type, std::string name);
    void pop();

    /**
     * @brief Push a frame and return the guard that pops it
     */
    [[nodiscard]] ScopeGuard enter(ElementType type, std::string name);

    [[nodiscard]] std::size_t depth() const { return stack_.size(); }
    [[nodiscard]] std::string parentPath() const;
    [[nodiscard]] const std::vector<ScopeFrame>& frames() const { return stack_; }

    /// Innermost open frame, or nullptr at top level
    [[nodiscard]] const ScopeFrame* innermost() const;

    /**
     * @brief Deterministic counter for synthesized names ("lambda" -> 0, 1, 2, ...)
     */
    std::size_t nextSynthetic(std::string_view kind);

    void addError(std::string message);

    /**
     * @brief Discard everything emitted so far and record the failure
     *
     * Used when a file cannot be parsed at all; the result then holds zero elements.
     */
    void parseFailure(std::string message);

    [[nodiscard]] const std::string& filepath() const { return filepath_; }
    [[nodiscard]] const std::vector<ElementRecord>& records() const { return records_; }
    [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }

private:
    std::string filepath_;
    std::size_t order_ = 0;
    std::vector<ScopeFrame> stack_;
    std::vector<ElementRecord> records_;
    std::vector<std::string> errors_;
    std::map<std::string, std::size_t, std::less<>> synthetic_;
};

} // namespace strata::extraction
