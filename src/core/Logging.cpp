#include "cactisynth/core/Logging.h"

Q_LOGGING_CATEGORY(lcUst, "cactisynth.ust")
Q_LOGGING_CATEGORY(lcOto, "cactisynth.oto")
Q_LOGGING_CATEGORY(lcVoiceBank, "cactisynth.voicebank")
Q_LOGGING_CATEGORY(lcProject, "cactisynth.project")
Q_LOGGING_CATEGORY(lcConfig, "cactisynth.config")
