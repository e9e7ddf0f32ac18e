#ifndef __CMUX_DIAGNOSTIC_COUNTERS__
#define __CMUX_DIAGNOSTIC_COUNTERS__

#include "Headers.hpp"

namespace cmux {
namespace diagnostics {
/**
 * @brief Counters that only exist so tests can observe internal invariant
 * checks. Exposed over the protocol behind the debug-commands switch.
 */
class DiagnosticCounters {
 public:
  DiagnosticCounters() : splitUnderflows(0) {}

  /**
   * @brief Records splits found with fewer than two children after an edit.
   */
  void recordSplitUnderflow(int count, const string& context) {
    if (count <= 0) {
      return;
    }
    splitUnderflows += count;
    STERROR << "Split layout underflow (" << count << " node(s)) after "
            << context;
  }

  int64_t getSplitUnderflows() const { return splitUnderflows.load(); }

  void resetSplitUnderflows() { splitUnderflows = 0; }

 protected:
  atomic<int64_t> splitUnderflows;
};
}  // namespace diagnostics
}  // namespace cmux

#endif  // __CMUX_DIAGNOSTIC_COUNTERS__
