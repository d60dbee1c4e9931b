#include <gtest/gtest.h>

#include "DataStructures.h"
#include "Partition.h"
#include "TestNetwork.h"

#include <set>
#include <string>

TEST(Partition, EveryReactionInExactlyOneSet) {
  MODEL model = makeTestNetwork();
  set<string> biomass, core;
  biomass.insert("B");
  core.insert("Core");
  PARTITION partition;
  partitionNetwork(model.rxns, biomass, core, partition);

  EXPECT_EQ(partition.size(), (int)model.rxns.rxns.size());
  for(int i=0; i<model.rxns.rxns.size(); i++) {
    int id = model.rxns.rxns[i].id;
    int count = partition.biomass.count(id) + partition.core.count(id) + partition.noncore.count(id);
    EXPECT_EQ(count, 1) << model.rxns.rxns[i].name;
  }
}

TEST(Partition, ToyNetworkSplit) {
  MODEL model = makeTestNetwork();
  set<string> biomass, core;
  biomass.insert("B");
  core.insert("Core");
  PARTITION partition;
  partitionNetwork(model.rxns, biomass, core, partition);

  ASSERT_EQ(partition.biomass.size(), 1u);
  EXPECT_EQ(*partition.biomass.begin(), model.rxns.idFromName("B"));
  EXPECT_EQ(partition.core.size(), 2u);
  EXPECT_TRUE(partition.core.count(model.rxns.idFromName("R1")) > 0);
  EXPECT_TRUE(partition.core.count(model.rxns.idFromName("R2")) > 0);
  ASSERT_EQ(partition.noncore.size(), 1u);
  EXPECT_EQ(*partition.noncore.begin(), model.rxns.idFromName("R3"));
}

TEST(Partition, BiomassNameBeatsCoreSubsystem) {
  MODEL model = makeTestNetwork();
  /* B is labelled "Core" in the test network */
  ASSERT_EQ(model.rxns.rxnPtrFromId(model.rxns.idFromName("B"))->subsystem, "Core");
  set<string> biomass, core;
  biomass.insert("B");
  core.insert("Core");
  PARTITION partition;
  partitionNetwork(model.rxns, biomass, core, partition);
  EXPECT_TRUE(partition.biomass.count(model.rxns.idFromName("B")) > 0);
  EXPECT_TRUE(partition.core.count(model.rxns.idFromName("B")) == 0);
}

TEST(Partition, CoreMetabolitesComeFromCoreReactionsOnly) {
  MODEL model = makeTestNetwork();
  set<string> biomass, core;
  biomass.insert("B");
  core.insert("Core");
  PARTITION partition;
  partitionNetwork(model.rxns, biomass, core, partition);

  EXPECT_EQ(partition.coreMets.size(), 3u);
  EXPECT_TRUE(partition.coreMets.count(model.metabolites.idFromName("M1")) > 0);
  EXPECT_TRUE(partition.coreMets.count(model.metabolites.idFromName("M2")) > 0);
  EXPECT_TRUE(partition.coreMets.count(model.metabolites.idFromName("M3")) > 0);
  EXPECT_TRUE(partition.coreMets.count(model.metabolites.idFromName("S")) == 0);
}

TEST(Partition, NoCoreSubsystemMakesEverythingNonCore) {
  MODEL model = makeTestNetwork();
  set<string> biomass, core;
  biomass.insert("B");
  core.insert("NotASubsystem");
  PARTITION partition;
  partitionNetwork(model.rxns, biomass, core, partition);
  EXPECT_TRUE(partition.core.empty());
  EXPECT_TRUE(partition.coreMets.empty());
  EXPECT_EQ(partition.noncore.size(), 3u);
  EXPECT_EQ(partition.biomass.size(), 1u);
}

TEST(Partition, MissingBiomassNamesAreReported) {
  MODEL model = makeTestNetwork();
  vector<string> wanted;
  wanted.push_back("B");
  wanted.push_back("NOPE");
  vector<string> missing = missingReactions(model.rxns, wanted);
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0], "NOPE");
}
