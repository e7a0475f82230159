#pragma once

namespace l20n {

struct CompilerOptions {
  // Write progress to stderr
  bool debug = false;
  // Report a repeated id as an error and keep the first definition.
  // By default the later definition replaces the earlier one.
  bool rejectDuplicateIds = false;
};

} // namespace l20n
