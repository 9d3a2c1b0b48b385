#pragma once
#include "RendoTableRow.h"

namespace RailSeed::Table {

// Fills the blanks and ditto marks a human reader resolves from the rows above.
class RowPreprocessor {
public:
    static void normalize(RendoTable& rows);

    static bool isDittoMark(const QString& value);
};

} // namespace RailSeed::Table
