#include "marksync/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcText, "marksync.text", QtInfoMsg)
Q_LOGGING_CATEGORY(lcStore, "marksync.store", QtInfoMsg)
Q_LOGGING_CATEGORY(lcSync, "marksync.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(lcApp, "marksync.app", QtInfoMsg)
