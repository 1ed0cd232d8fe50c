#include <strata/extraction/traversal_context.h>

#include <spdlog/spdlog.h>

namespace strata::extraction {

std::string ScopeFrame::label() const {
    std::string label = std::string(toString(type)) + ":";
    label.reserve(label.size() + name.size());
    for (char c : name) {
        // '/' separates frames in a parent path
        if (c == '/' || c == '\\')
            label += '\\';
        label += c;
    }
    return label;
}

ScopeGuard::~ScopeGuard() {
    if (ctx_) {
        ctx_->pop();
    }
}

TraversalContext::TraversalContext(std::string filepath) : filepath_(std::move(filepath)) {}

const ElementRecord& TraversalContext::emit(Element element) {
    nlohmann::json props = std::move(element.props);
    if (!props.is_object()) {
        props = nlohmann::json::object();
    }
    if (!element.parameters.empty()) {
        props["parameters"] = element.parameters;
    }
    if (!element.comments.empty()) {
        props["comments"] = element.comments;
    }
    if (element.line > 0) {
        props["line"] = element.line;
    }

    ElementRecord record;
    record.filepath = filepath_;
    record.parentPath = parentPath();
    record.order = ++order_;
    record.name = std::move(element.name);
    record.content = std::move(element.content);
    record.props = props.dump();
    record.elementType = element.type;
    record.nestingLevel = stack_.size();

    records_.push_back(std::move(record));
    return records_.back();
}

void TraversalContext::push(ElementType type, std::string name) {
    stack_.push_back(ScopeFrame{type, std::move(name)});
}

void TraversalContext::pop() {
    if (stack_.empty()) {
        spdlog::error("Scope stack underflow while traversing {}", filepath_);
        return;
    }
    stack_.pop_back();
}

ScopeGuard TraversalContext::enter(ElementType type, std::string name) {
    push(type, std::move(name));
    return ScopeGuard(*this);
}

std::string TraversalContext::parentPath() const {
    std::string path;
    for (const auto& frame : stack_) {
        if (!path.empty()) {
            path += '/';
        }
        path += frame.label();
    }
    return path;
}

const ScopeFrame* TraversalContext::innermost() const {
    return stack_.empty() ? nullptr : &stack_.back();
}

std::size_t TraversalContext::nextSynthetic(std::string_view kind) {
    auto it = synthetic_.find(kind);
    if (it == synthetic_.end()) {
        synthetic_.emplace(std::string(kind), 1);
        return 0;
    }
    return it->second++;
}

void TraversalContext::addError(std::string message) {
    spdlog::debug("{}: {}", filepath_, message);
    errors_.push_back(std::move(message));
}

void TraversalContext::parseFailure(std::string message) {
    records_.clear();
    order_ = 0;
    addError(std::move(message));
}

} // namespace strata::extraction
