#include "collection/PartitionTaskRunner.h"
#include "core/Params.h"
#include "core/StatusPrinter.h"
#include "core/Timer.h"
#include "sampling/CountAggregator.h"
#include "sampling/PartitionClassifier.h"
#include "sampling/PartitionMapper.h"
#include "sampling/ScalableSRS.h"
#include "sampling/SetSizeNormalizer.h"
#include "sampling/ThresholdCalculator.h"

SamplingConfig::SamplingConfig()
  : hasCount(false),
    count(0),
    delta(5e-5),
    hasSeed(false),
    seed(0),
    reproportion(false),
    layout(AUTO_LAYOUT) {
}

SamplingConfig SamplingConfig::fromParams(const Params& params) {
  SamplingConfig config;

  parseTargetSetSpecs(params.get<std::string>("SET_SIZES"), config.setSizes);

  if (params.contains("COUNT")) {
    config.hasCount = true;
    config.count = params.get<uint64_t>("COUNT");
  }

  config.delta = params.get<double>("DELTA", config.delta);

  if (params.contains("SEED")) {
    config.hasSeed = true;
    config.seed = params.get<uint64_t>("SEED");
  }

  config.reproportion = params.get<bool>("REPROPORTION", false);
  config.layout = parseKeyspaceLayout(
    params.get<std::string>("KEYSPACE_LAYOUT", "auto"));

  return config;
}

void SamplingResult::countLabels(
  std::map<std::string, uint64_t>& labelCounts) const {

  for (PlannedSetList::const_iterator iter = plan.sets.begin();
       iter != plan.sets.end(); iter++) {
    labelCounts[iter->name] = 0;
  }

  for (uint64_t i = 0; i < output.numPartitions(); i++) {
    const std::vector<LabeledRecord>& partition = output.getPartition(i);

    for (std::vector<LabeledRecord>::const_iterator iter = partition.begin();
         iter != partition.end(); iter++) {
      labelCounts[iter->setName]++;
    }
  }
}

ScalableSRS::ScalableSRS(
  const SamplingConfig& _config, PartitionTaskRunner& _runner)
  : config(_config),
    seed(_config.hasSeed ? _config.seed : Timer::posixTimeInSeconds()),
    runner(_runner) {
  StatusPrinter::add("Sampling with seed %llu", seed);
}

uint64_t ScalableSRS::getSeed() const {
  return seed;
}

void ScalableSRS::sample(
  const PartitionedCollection<std::string>& records, SamplingResult& result) {

  plan(records, result);
  classify(records, result);
  refine(result);
  label(records, result);
}

void ScalableSRS::plan(
  const PartitionedCollection<std::string>& records,
  SamplingResult& result) const {

  uint64_t population = config.hasCount ? config.count : records.count();
  plan(population, result);
}

void ScalableSRS::plan(uint64_t population, SamplingResult& result) const {
  result.seed = seed;
  result.population = population;

  StatusPrinter::add(
    StatusPrinter::CH_STATISTIC, "Population %llu, delta %g, %s layout",
    population, config.delta, keyspaceLayoutName(config.layout));

  TargetSetSizeList sizes;
  SetSizeNormalizer normalizer(config.reproportion);
  normalizer.normalize(config.setSizes, population, sizes);

  ThresholdCalculator calculator(config.delta, config.layout);
  calculator.computePlan(sizes, population, result.plan);
}

void ScalableSRS::classify(
  const PartitionedCollection<std::string>& records, SamplingResult& result) {

  Timer timer;
  timer.start();

  PartitionClassifier classifier(result.plan, seed);
  PartitionedCollection<TallyMap> tallies;
  records.mapPartitionsWithIndex(classifier, runner, tallies);

  CountAggregator::aggregate(tallies, result.globalTally);

  timer.stop();
  StatusPrinter::add(
    StatusPrinter::CH_STATISTIC, "Classified %llu partitions in %llu us",
    records.numPartitions(), timer.getElapsed());
}

void ScalableSRS::refine(SamplingResult& result) const {
  ThresholdRefiner refiner;
  refiner.refine(
    result.plan, result.globalTally, result.finalThresholds,
    result.advisories);
}

void ScalableSRS::label(
  const PartitionedCollection<std::string>& records, SamplingResult& result) {

  Timer timer;
  timer.start();

  PartitionMapper mapper(result.finalThresholds, seed);
  records.mapPartitionsWithIndex(mapper, runner, result.output);

  timer.stop();
  StatusPrinter::add(
    StatusPrinter::CH_STATISTIC, "Labeled %llu records in %llu us",
    result.output.count(), timer.getElapsed());
}
