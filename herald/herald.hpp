#pragma once

#include "herald/color/color.hpp"
#include "herald/compose/compose.hpp"
#include "herald/culprit/culprit.hpp"
#include "herald/errors/errors.hpp"
#include "herald/informant/informant.hpp"
#include "herald/progress/progress.hpp"
#include "herald/session/session.hpp"
#include "herald/text/text.hpp"
#include "herald/types/value.hpp"

namespace herald {

namespace opt = compose::opt;
using compose::kw;

using informant::codicil;
using informant::comment;
using informant::debug;
using informant::display;
using informant::error;
using informant::fatal;
using informant::log;
using informant::narrate;
using informant::notify;
using informant::output;
using informant::panic;
using informant::warn;

using session::add_culprit;
using session::done;
using session::errors_accrued;
using session::get_culprit;
using session::get_informer;
using session::get_prog_name;
using session::join_culprit;
using session::set_culprit;
using session::set_informer;
using session::terminate;
using session::terminate_if_errors;

using errors::error_c;
using errors::error_kind_c;
using errors::report_as;
using progress::progress_bar_c;
using session::informer_c;
using session::informer_options_s;

} // namespace herald
