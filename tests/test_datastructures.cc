#include <gtest/gtest.h>

#include "DataStructures.h"
#include "TestNetwork.h"

#include <vector>

TEST(RxnSpace, DuplicateIdOrNameIsSkipped) {
  MODEL model = makeTestNetwork();
  int before = model.rxns.rxns.size();
  vector<STOICH> st;
  st.push_back(makeStoich("M1", -1.0, model.metabolites.idFromName("M1")));
  st.push_back(makeStoich("M2", 1.0, model.metabolites.idFromName("M2")));

  model.rxns.addReaction(makeReaction(0, "R9", "Core", 0.0, 10.0, st));
  model.rxns.addReaction(makeReaction(42, "R1", "Core", 0.0, 10.0, st));
  EXPECT_EQ((int)model.rxns.rxns.size(), before);
  EXPECT_EQ(model.rxns.idFromName("R9"), -1);

  model.rxns.addReaction(makeReaction(42, "R9", "Core", 0.0, 10.0, st));
  EXPECT_EQ((int)model.rxns.rxns.size(), before + 1);
  EXPECT_EQ(model.rxns.rxnPtrFromId(42)->name, "R9");
}

TEST(RxnSpace, UnknownNameGivesMinusOne) {
  MODEL model = makeTestNetwork();
  EXPECT_EQ(model.rxns.idFromName("nope"), -1);
  EXPECT_EQ(model.metabolites.idFromName("nope"), -1);
  EXPECT_FALSE(model.rxns.idIn(1000));
}

TEST(RxnSpace, ChangeLbRaisesUbWhenNeeded) {
  MODEL model = makeTestNetwork();
  int id = model.rxns.idFromName("B");
  model.rxns.change_Lb(id, 0.05);
  EXPECT_DOUBLE_EQ(model.rxns.rxnPtrFromId(id)->lb, 0.05);
  EXPECT_DOUBLE_EQ(model.rxns.rxnPtrFromId(id)->ub, 0.1);

  model.rxns.change_Lb(id, 0.5);
  EXPECT_DOUBLE_EQ(model.rxns.rxnPtrFromId(id)->lb, 0.5);
  EXPECT_DOUBLE_EQ(model.rxns.rxnPtrFromId(id)->ub, 0.5);
}

TEST(RxnSpace, CopyKeepsLookups) {
  MODEL model = makeTestNetwork();
  RXNSPACE copy;
  copy = model.rxns;
  ASSERT_EQ(copy.rxns.size(), model.rxns.rxns.size());
  EXPECT_EQ(copy.idFromName("R3"), model.rxns.idFromName("R3"));
  EXPECT_EQ(copy.rxnPtrFromId(copy.idFromName("R3"))->subsystem, "Transport");
}

TEST(Reaction, BoundaryAndCoefficients) {
  MODEL model = makeTestNetwork();
  const REACTION *r1 = model.rxns.rxnPtrFromId(model.rxns.idFromName("R1"));
  const REACTION *b = model.rxns.rxnPtrFromId(model.rxns.idFromName("B"));
  EXPECT_FALSE(r1->isBoundary());
  EXPECT_TRUE(b->isBoundary());
  EXPECT_DOUBLE_EQ(r1->coeffOf(model.metabolites.idFromName("M1")), -1.0);
  EXPECT_DOUBLE_EQ(r1->coeffOf(model.metabolites.idFromName("M3")), 0.0);
}

TEST(Solution, MissingNamesReadAsZero) {
  SOLUTION sol;
  sol.fluxes["R1"] = 2.5;
  EXPECT_DOUBLE_EQ(sol.flux("R1"), 2.5);
  EXPECT_DOUBLE_EQ(sol.flux("R2"), 0.0);
  EXPECT_DOUBLE_EQ(sol.primal("LC_R3"), 0.0);
}
