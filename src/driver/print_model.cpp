/***
 * Name: archlink::driver::PrintModel
 * Purpose: Write "<caller> -> <kind> <target> line <n> [<binding>]" lines.
 * Theory of Operation: Callers in CodeUnit order; per caller, field accesses,
 *   then method calls, then constructor calls, each already sorted by line.
 */
#include "archlink/driver/app.h"

namespace archlink::driver {

void PrintModel(std::ostream& out, const pipeline::ResolvedModel& resolved,
                const std::optional<model::CodeUnit>& onlyCaller) {
  for (const auto& caller : resolved.callers()) {
    if (onlyCaller && *onlyCaller != caller) {
      continue;
    }
    for (const auto* records : {&resolved.fieldAccessesFrom(caller), &resolved.methodCallsFrom(caller),
                                &resolved.constructorCallsFrom(caller)}) {
      for (const auto& record : *records) {
        out << record.toString() << "\n";
      }
    }
  }
}

}  // namespace archlink::driver
