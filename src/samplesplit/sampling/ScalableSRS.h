#ifndef SAMPLESPLIT_SCALABLE_SRS_H
#define SAMPLESPLIT_SCALABLE_SRS_H

#include <map>
#include <stdint.h>
#include <string>

#include "collection/PartitionedCollection.h"
#include "core/constants.h"
#include "sampling/LabeledRecord.h"
#include "sampling/SamplingPlan.h"
#include "sampling/SetTally.h"
#include "sampling/TargetSetSpec.h"
#include "sampling/ThresholdRefiner.h"

class Params;
class PartitionTaskRunner;

/// User-facing configuration of a sampling run
struct SamplingConfig {
  /// The requested sets, in the order their key ranges are laid out
  TargetSetSpecList setSizes;

  /// If true, count is used as the population instead of counting records
  bool hasCount;
  uint64_t count;

  double delta;

  /// If false, the seed is taken from the wall clock when the run starts
  bool hasSeed;
  uint64_t seed;

  bool reproportion;
  KeyspaceLayout layout;

  /// Constructor; delta is 5e-5, the layout is auto and nothing else is set
  SamplingConfig();

  /**
     Read a configuration from the SET_SIZES, COUNT, DELTA, SEED,
     REPROPORTION and KEYSPACE_LAYOUT parameters. Only SET_SIZES is required.

     \throws InvalidConfigurationException if SET_SIZES or KEYSPACE_LAYOUT is
     malformed
   */
  static SamplingConfig fromParams(const Params& params);
};

/// Everything a sampling run produced, for callers and reports
struct SamplingResult {
  uint64_t seed;
  uint64_t population;

  /// The normalized sets and their first-pass thresholds
  SamplingPlan plan;

  TallyMap globalTally;
  FinalThresholdList finalThresholds;
  AdvisoryList advisories;

  /// Records labeled by set, partitioned like the input
  PartitionedCollection<LabeledRecord> output;

  SamplingResult()
    : seed(0),
      population(0) {}

  /**
     Count labeled records by set. Every planned set has an entry, even if no
     records were labeled with it.
   */
  void countLabels(std::map<std::string, uint64_t>& labelCounts) const;
};

/**
   ScalableSRS draws exact-size disjoint simple random samples from a
   partitioned collection in two passes.

   sample() runs the whole pipeline on one collection. The individual stages
   are exposed so that callers that can't keep their input in memory can
   supply a fresh copy of the same records to each pass; the records and
   their partitioning must be identical for both passes.
 */
class ScalableSRS {
public:
  /// Constructor
  /**
     The seed is resolved here, once, from the configuration or the wall
     clock.

     \param config the run's configuration

     \param runner the runner on which partition functions are executed
   */
  ScalableSRS(const SamplingConfig& config, PartitionTaskRunner& runner);

  /// \return the seed used by every pass of this run
  uint64_t getSeed() const;

  /**
     Run both passes over a collection.

     \throws InvalidConfigurationException for unusable set sizes or delta

     \throws CapacityExceededException if the sets don't fit in the key space

     \param records the records to sample from

     \param[out] result the results of the run
   */
  void sample(
    const PartitionedCollection<std::string>& records, SamplingResult& result);

  /**
     Normalize set sizes and compute first-pass thresholds.

     \param records the records to sample from; only counted, and only if the
     configuration doesn't give the population

     \param[out] result receives the seed, population and plan
   */
  void plan(
    const PartitionedCollection<std::string>& records,
    SamplingResult& result) const;

  /// Normalize set sizes and compute thresholds for a known population
  void plan(uint64_t population, SamplingResult& result) const;

  /// Run the first pass and aggregate the tallies into result.globalTally
  void classify(
    const PartitionedCollection<std::string>& records, SamplingResult& result);

  /// Compute final thresholds and advisories from the global tally
  void refine(SamplingResult& result) const;

  /// Run the second pass, filling result.output
  void label(
    const PartitionedCollection<std::string>& records, SamplingResult& result);

private:
  const SamplingConfig config;
  const uint64_t seed;
  PartitionTaskRunner& runner;
};

#endif // SAMPLESPLIT_SCALABLE_SRS_H
