#pragma once
#include <stdint.h>

#include "nav/EffectsController.h"
#include "nav/NavConfig.h"
#include "nav/Navigator.h"
#include "nav/Ports.h"
#include "nav/StatusReporter.h"

/*
===============================================================================
  RunController.h
===============================================================================

  PURPOSE
  -------
  Owns the single active run and connects the Navigator to the ports.

  Responsibilities:
    - start(command): map the command, reject it if a run is active or the
      command is unknown (REJECT policy), settle the sensor, begin the run
    - tick(): read one sample, step the navigator, execute its actions,
      advance the hazard siren
    - cancel(): latch a cancel that the next tick turns into a stop
    - calibrate(on): raw sensor readout mode, only while no run is active;
      starting a run or a cancel ends it

  USAGE
  -----
  - Call tick() once per sample period (NavConfig::sample_period_ms)
  - Turn-around and final push block inside tick() until the wheels stop
===============================================================================
*/

class RunController {
public:
  RunController(const NavConfig& cfg,
                SensorPort& sensors,
                DrivePort& drive,
                CuePort& cue,
                StatusSink& sink,
                Clock& clock);

  // Returns false (and emits REJECTED) if no run was started
  bool start(const char* command);

  void cancel();

  void tick();

  // Returns false (and emits REJECTED command=CALIBRATE) if a run is active
  bool calibrate(bool enable);

  bool active() const { return _running; }
  bool calibrating() const { return _calibrating; }

  const Navigator& navigator() const { return _nav; }
  const NavConfig& config() const { return _cfg; }
  StatusReporter& status() { return _status; }

  // Runs started / rejected since boot
  uint16_t runsStarted() const { return _runs_started; }
  uint16_t runsRejected() const { return _runs_rejected; }

private:
  SensorSample readSample_();
  void apply_(const DriveActions& act);

  void turnAround_();
  void finalPush_();
  void updateEffects_();

  NavConfig _cfg;

  SensorPort& _sensors;
  DrivePort& _drive;
  CuePort& _cue;
  Clock& _clock;

  StatusReporter _status;
  Navigator _nav;
  EffectsController _effects;

  bool _running = false;
  bool _calibrating = false;
  uint16_t _runs_started = 0;
  uint16_t _runs_rejected = 0;
};
