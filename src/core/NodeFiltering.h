#pragma once

#include "BookmarkTypes.h"

namespace arcmark
{
// Case-insensitive search over link titles, link URLs and folder names. A folder with
// matching descendants is kept, expanded, with only the matching branches. A folder
// with none is kept whole, expanded, when its own name matches. A blank query returns
// the nodes unchanged.
NodeList filterNodes(const NodeList& nodes, const QString& query);
}
