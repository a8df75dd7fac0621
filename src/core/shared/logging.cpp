#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(srCore, "shoprank.core")
Q_LOGGING_CATEGORY(srConfig, "shoprank.config")
Q_LOGGING_CATEGORY(srRanking, "shoprank.ranking")
Q_LOGGING_CATEGORY(srExperiment, "shoprank.experiment")
