#pragma once
#include <stdint.h>

#include "nav/NavConfig.h"
#include "nav/ObstacleGuard.h"
#include "nav/ReflectanceFilter.h"
#include "nav/Scenario.h"
#include "nav/SensorSample.h"
#include "nav/StatusReporter.h"
#include "nav/ZoneClassifier.h"

/*
===============================================================================
  Navigator.h
===============================================================================

  PURPOSE
  -------
  The navigation state machine for one run, written as an explicit step
  function:

      actions = navigator.step(sample)

  called once per sampling tick. The navigator never touches motors
  itself; it returns DriveActions and the caller (RunController) executes
  them. Status tokens are emitted through StatusReporter as transitions
  happen.

  PHASES
  ------
    INIT                stationary; prefill history, pre-check start zone
    WARMUP              driving; classification ignored for warmup_samples
    SEARCHING           driving; classify, count hits, check wrong way
    OBSTACLE_RECOVERY   turn-around requested because of an obstacle
    WRONG_WAY_RECOVERY  turn-around requested because of an overshoot
    ARRIVED             target confirmed; final push requested
    DONE                terminal

  Recovery phases last until the next step, which re-enters WARMUP and
  counts as warmup sample 1.

  Wrong-way rule (slots Edge1=0, Middle=1, Edge2=2):
    target Edge1 : zone == Edge2 && Middle visited && Edge1 not visited
    target Edge2 : zone == Edge1 && Middle visited && Edge2 not visited
    target Middle: Edge1 && Edge2 visited && hits == 0
===============================================================================
*/

enum class NavPhase : uint8_t {
  INIT = 0,
  WARMUP,
  SEARCHING,
  OBSTACLE_RECOVERY,
  WRONG_WAY_RECOVERY,
  ARRIVED,
  DONE,
};

// Executed by the caller in field order
struct DriveActions {
  bool stop = false;            // stopAll()
  bool alert = false;           // obstacle beep
  bool turn_around = false;     // blocking in-place 180
  bool final_push = false;      // blocking fixed-angle drive, then stop
  bool drive = false;           // runContinuous(drive_speed_dps, drive_speed_dps)
  int16_t drive_speed_dps = 0;
  bool confirm = false;         // completion cue

  bool any() const {
    return stop || alert || turn_around || final_push || drive || confirm;
  }
};

struct RunState {
  NavPhase phase = NavPhase::INIT;

  uint8_t  visited = 0;              // bit per slot
  uint8_t  consecutive_hits = 0;
  uint16_t sample_counter = 0;       // samples since the last (re)start

  // Last classification
  Color zone = Color::NONE;
  bool  zone_valid = false;

  uint16_t obstacle_recoveries = 0;
  uint16_t wrong_way_recoveries = 0;
  uint32_t ticks = 0;

  bool arrived_by_precheck = false;
  bool cancel_requested = false;
  bool cancelled = false;
};

namespace nav {
const char* phaseName(NavPhase p);
}

class Navigator {
public:
  Navigator(const NavConfig& cfg, StatusReporter& status);

  // Start a fresh run. Emits START and TARGET_COLOR.
  void begin(const TargetSelection& selection);

  DriveActions step(const SensorSample& sample);

  // Latched; acted on at the start of the next step. Ignored once ARRIVED.
  void cancel();

  bool begun() const { return _begun; }
  bool finished() const { return _state.phase == NavPhase::DONE; }
  bool active() const { return _begun && !finished(); }

  const RunState& state() const { return _state; }
  NavPhase phase() const { return _state.phase; }

  const SensorSample& lastSample() const { return _sample; }
  const TargetSelection& selection() const { return _selection; }
  const NavConfig& config() const { return _cfg; }
  const ReflectanceFilter& filter() const { return _filter; }

  bool visited(Color zone) const;

  // Drive speed for this run (turbo in hazard mode)
  int16_t runSpeedDps() const;

private:
  void stepInit_(DriveActions& act);
  void stepWarmup_(DriveActions& act);
  void stepSearching_(DriveActions& act);

  void enterRecovery_(NavPhase phase, DriveActions& act);
  void arrive_(DriveActions& act);
  void cancelRun_(DriveActions& act);

  bool wrongWay_(uint8_t slot) const;
  void resetProgress_();
  void countSample_();

  NavConfig _cfg;
  StatusReporter& _status;

  ZoneClassifier _classifier;
  ObstacleGuard _guard;
  ReflectanceFilter _filter;

  TargetSelection _selection;
  RunState _state;
  SensorSample _sample;

  bool _begun = false;
};
