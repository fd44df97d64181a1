// codetrace/instrument/node_dispatcher.hpp - Node kind to handler dispatch
#pragma once

#include <string_view>
#include <unordered_map>

#include "codetrace/syntax/ts_ll.hpp"

namespace codetrace
{

/**
 * Table of per-kind handlers for an instrumentation pass.
 *
 * The table is filled once when a backend is constructed and is read-only
 * afterwards; all mutable traversal state lives in the `Pass` object handed
 * to walk(). Enter handlers run in pre-order, leave handlers after the
 * node's subtree has been visited.
 *
 * Kind keys must have static storage duration (string literals).
 */
template <typename Pass>
class NodeDispatcher
{
public:
  using Handler = void (Pass::*)(ts_ll::Node);

  void on_enter(std::string_view kind, Handler handler) { enter_[kind] = handler; }
  void on_leave(std::string_view kind, Handler handler) { leave_[kind] = handler; }

  [[nodiscard]] bool handles(std::string_view kind) const
  {
    return enter_.count(kind) != 0 || leave_.count(kind) != 0;
  }

  /// Depth-first traversal of `node` and all of its children
  void walk(Pass & pass, ts_ll::Node node) const
  {
    if (node.is_null()) {
      return;
    }

    const std::string_view kind = node.kind();
    if (const auto it = enter_.find(kind); it != enter_.end()) {
      (pass.*(it->second))(node);
    }

    const uint32_t count = node.child_count();
    for (uint32_t i = 0; i < count; ++i) {
      walk(pass, node.child(i));
    }

    if (const auto it = leave_.find(kind); it != leave_.end()) {
      (pass.*(it->second))(node);
    }
  }

private:
  std::unordered_map<std::string_view, Handler> enter_;
  std::unordered_map<std::string_view, Handler> leave_;
};

}  // namespace codetrace
