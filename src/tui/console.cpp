#include "tui/console.h"

namespace avatarcli {
namespace tui {

const char* const PREVIOUS_PAGE_LABEL = "← Previous Page";
const char* const NEXT_PAGE_LABEL = "→ Next Page";
const char* const GO_BACK_LABEL = "← Go Back";

}
}
