#ifndef ERRORMESSAGES_H
#define ERRORMESSAGES_H

#include <libintl.h>

#define _(String) gettext(String)

#define MSG_PROMPT_DATE _("Please validate/enter the date for {} (YYYYMMDD)")
#define MSG_PROMPT_OPEN_HINT _("'o' to open")
#define MSG_INVALID_DATE_FORMAT _("Invalid date format. Please try again.")
#define MSG_DATE_OUT_OF_RANGE _("Date is outside the accepted range. Please try again.")
#define MSG_NO_DATE_STAMP _("No date stamp could be extracted from {}.")
#define MSG_STALE_DATE _("The parsed date stamp is more than {} days away from today's date.")

#endif
