#include <algorithm>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <glpk.h>
#include <set>
#include <vector>

#include "DataStructures.h"
#include "genericLinprog.h"
#include "MyConstants.h"

/* GLPK refuses names longer than this */
#define GLPK_MAX_NAME 255

SOLVERPARAMS::SOLVERPARAMS() {
  timeout = _db.DEFAULT_TIMEOUT;
  feasibility = _db.DEFAULT_FEASIBILITY;
  mipGap = _db.DEFAULT_MIP_GAP;
}

/**************** Public Methods ****************/

GLPKMILP::GLPKMILP() {
  objSense = SENSE_MAX;
  problem = glp_create_prob();
}

GLPKMILP::~GLPKMILP() {
  glp_delete_prob(problem);
}

bool GLPKMILP::addVariable(const GENERICVARIABLE &var) {
  string name = var.name();
  if(hasVariable(name)) {
    printf("ERROR: Variable %s is already in the problem\n", name.c_str());
    return false;
  }
  if(var.lb > var.ub) {
    printf("ERROR: Variable %s has lower bound %4.3f above its upper bound %4.3f\n", name.c_str(), var.lb, var.ub);
    return false;
  }
  MILPCOLUMN col;
  col.name = name;
  col.lb = var.lb;
  col.ub = var.ub;
  col.kind = var.kind;
  cols.push_back(col);
  colIdx[name] = cols.size() - 1;
  return true;
}

bool GLPKMILP::addConstraint(const GENERICCONSTRAINT &cons) {
  string name = cons.name();
  if(hasConstraint(name)) {
    printf("ERROR: Constraint %s is already in the problem\n", name.c_str());
    return false;
  }
  for(map<string, double>::const_iterator it = cons.expr.coef.begin(); it != cons.expr.coef.end(); ++it) {
    if(!hasVariable(it->first)) {
      printf("ERROR: Constraint %s uses variable %s which is not in the problem\n", name.c_str(), it->first.c_str());
      return false;
    }
  }
  MILPROW row;
  row.name = name;
  row.expr = cons.expr;
  row.lb = cons.lb;
  row.ub = cons.ub;
  rows.push_back(row);
  rowIdx[name] = rows.size() - 1;
  return true;
}

/* Any constraint or objective term still using the variable is dropped when the problem is set up */
bool GLPKMILP::removeVariable(const string &name) {
  return removeVariables(vector<string>(1, name)).empty();
}

bool GLPKMILP::removeConstraint(const string &name) {
  return removeConstraints(vector<string>(1, name)).empty();
}

/* Erase in one sweep and reindex once. Returns the names that were not in the problem */
vector<string> GLPKMILP::removeVariables(const vector<string> &names) {
  vector<string> missing;
  set<string> doomed;
  for(int i=0; i<names.size(); i++) {
    if(colIdx.count(names[i]) == 0) { missing.push_back(names[i]); }
    else { doomed.insert(names[i]); }
  }
  if(doomed.empty()) { return missing; }
  vector<MILPCOLUMN> kept;
  kept.reserve(cols.size() - doomed.size());
  for(int i=0; i<cols.size(); i++) {
    if(doomed.count(cols[i].name) == 0) { kept.push_back(cols[i]); }
  }
  cols.swap(kept);
  reindexColumns();
  return missing;
}

vector<string> GLPKMILP::removeConstraints(const vector<string> &names) {
  vector<string> missing;
  set<string> doomed;
  for(int i=0; i<names.size(); i++) {
    if(rowIdx.count(names[i]) == 0) { missing.push_back(names[i]); }
    else { doomed.insert(names[i]); }
  }
  if(doomed.empty()) { return missing; }
  vector<MILPROW> kept;
  kept.reserve(rows.size() - doomed.size());
  for(int i=0; i<rows.size(); i++) {
    if(doomed.count(rows[i].name) == 0) { kept.push_back(rows[i]); }
  }
  rows.swap(kept);
  reindexRows();
  return missing;
}

bool GLPKMILP::hasVariable(const string &name) const {
  return colIdx.count(name) > 0;
}

bool GLPKMILP::hasConstraint(const string &name) const {
  return rowIdx.count(name) > 0;
}

vector<string> GLPKMILP::variablesWithPrefix(const string &prefix) const {
  vector<string> result;
  for(int i=0; i<cols.size(); i++) {
    if(cols[i].name.compare(0, prefix.size(), prefix) == 0) { result.push_back(cols[i].name); }
  }
  return result;
}

vector<string> GLPKMILP::constraintsWithPrefix(const string &prefix) const {
  vector<string> result;
  for(int i=0; i<rows.size(); i++) {
    if(rows[i].name.compare(0, prefix.size(), prefix) == 0) { result.push_back(rows[i].name); }
  }
  return result;
}

int GLPKMILP::numVariables() const {
  return cols.size();
}

int GLPKMILP::numConstraints() const {
  return rows.size();
}

int GLPKMILP::numIntegerVariables() const {
  int count = 0;
  for(int i=0; i<cols.size(); i++) {
    if(cols[i].kind != VAR_CONTINUOUS) { count++; }
  }
  return count;
}

void GLPKMILP::setObjective(const LINEXPR &expr, int sense) {
  validateSense(sense);
  obj = expr;
  objSense = sense;
}

const LINEXPR& GLPKMILP::objective() const {
  return obj;
}

int GLPKMILP::objectiveSense() const {
  return objSense;
}

void GLPKMILP::setParams(const SOLVERPARAMS &newParams) {
  params = newParams;
}

/* Use the simplex alone if nothing is integer - otherwise branch and bound */
int GLPKMILP::solve(map<string, double> &primals, double &objValue) {
  primals.clear();
  objValue = 0.0f;
  setUpProblem();
  if(numIntegerVariables() == 0) {
    return solveLp(primals, objValue);
  }
  return solveMilp(primals, objValue);
}

/* Print out all those lovely private variables */
void GLPKMILP::printPrivateStuff() {
  for(int i=0; i<cols.size(); i++) {
    printf("VARIABLE: %s ... ", cols[i].name.c_str());
    printf("LB = %4.3f; UB = %4.3f; %s\n", cols[i].lb, cols[i].ub, cols[i].kind == VAR_CONTINUOUS ? "continuous" : "integer");
  }
  for(int i=0; i<rows.size(); i++) {
    printf("CONSTRAINT: %s (%4.3f <= ", rows[i].name.c_str(), rows[i].lb);
    for(map<string, double>::const_iterator it = rows[i].expr.coef.begin(); it != rows[i].expr.coef.end(); ++it) {
      printf("%+4.3f %s ", it->second, it->first.c_str());
    }
    printf("<= %4.3f)\n", rows[i].ub);
  }
  printf("OBJECTIVE (%s):\n", objSense == SENSE_MAX ? "MAX" : "MIN");
  for(map<string, double>::const_iterator it = obj.coef.begin(); it != obj.coef.end(); ++it) {
    printf("%s (coefficient = %4.3f)\n", it->first.c_str(), it->second);
  }
}

/************************ Private Methods ************************/

void GLPKMILP::reindexColumns() {
  colIdx.clear();
  for(int i=0; i<cols.size(); i++) { colIdx[cols[i].name] = i; }
}

void GLPKMILP::reindexRows() {
  rowIdx.clear();
  for(int i=0; i<rows.size(); i++) { rowIdx[rows[i].name] = i; }
}

void GLPKMILP::validateSense(int sense) {
  if(sense != SENSE_MIN && sense != SENSE_MAX) {
    printf("WARNING: Unknown objective sense %d - maximizing\n", sense);
  }
}

/* Bound type for lb <= x <= ub where either side may be +/- NO_BOUND */
static int glpkBoundType(double lb, double ub) {
  bool hasLb = (lb > -NO_BOUND);
  bool hasUb = (ub < NO_BOUND);
  if(hasLb && hasUb) {
    if(lb == ub) { return GLP_FX; }
    return GLP_DB;
  }
  if(hasLb) { return GLP_LO; }
  if(hasUb) { return GLP_UP; }
  return GLP_FR;
}

/* Set up the glp_prob "problem" to have all the data it needs from the current columns, rows and objective.
   Deletes the old problem and starts fresh every time. */
void GLPKMILP::setUpProblem() {
  glp_delete_prob(problem);
  problem = glp_create_prob();

  if(objSense == SENSE_MIN) { glp_set_obj_dir(problem, GLP_MIN); }
  else { glp_set_obj_dir(problem, GLP_MAX); }

  int numcols = cols.size();
  int numrows = rows.size();
  if(numrows > 0) { glp_add_rows(problem, numrows); }
  if(numcols > 0) { glp_add_cols(problem, numcols); }

  for(int j=0; j<numcols; j++) {
    if(cols[j].name.size() <= GLPK_MAX_NAME) { glp_set_col_name(problem, j+1, cols[j].name.c_str()); }
    if(cols[j].kind == VAR_BINARY) {
      glp_set_col_kind(problem, j+1, GLP_BV);
    } else {
      if(cols[j].kind == VAR_INTEGER) { glp_set_col_kind(problem, j+1, GLP_IV); }
      int type = glpkBoundType(cols[j].lb, cols[j].ub);
      glp_set_col_bnds(problem, j+1, type, type == GLP_UP || type == GLP_FR ? 0.0f : cols[j].lb,
		       type == GLP_LO || type == GLP_FR ? 0.0f : cols[j].ub);
    }
  }

  /* The constant of a row expression moves to the bounds */
  vector<int> ia(1, 0), ja(1, 0);
  vector<double> ar(1, 0.0f);
  for(int i=0; i<numrows; i++) {
    if(rows[i].name.size() <= GLPK_MAX_NAME) { glp_set_row_name(problem, i+1, rows[i].name.c_str()); }
    double lb = rows[i].lb - rows[i].expr.constant;
    double ub = rows[i].ub - rows[i].expr.constant;
    int type = glpkBoundType(rows[i].lb, rows[i].ub);
    glp_set_row_bnds(problem, i+1, type, type == GLP_UP || type == GLP_FR ? 0.0f : lb,
		     type == GLP_LO || type == GLP_FR ? 0.0f : ub);

    for(map<string, double>::const_iterator it = rows[i].expr.coef.begin(); it != rows[i].expr.coef.end(); ++it) {
      /* Don't allow 0's to mess things up... */
      if(it->second < 1E-12 && it->second > -1E-12) { continue; }
      map<string, int>::const_iterator c = colIdx.find(it->first);
      if(c == colIdx.end()) {
	printf("WARNING: Dropping removed variable %s from constraint %s\n", it->first.c_str(), rows[i].name.c_str());
	continue;
      }
      ia.push_back(i+1);
      ja.push_back(c->second + 1);
      ar.push_back(it->second);
    }
  }
  glp_load_matrix(problem, ia.size() - 1, &ia[0], &ja[0], &ar[0]);

  /* Objective function - all zeros except for the variables in obj */
  glp_set_obj_coef(problem, 0, obj.constant);
  for(map<string, double>::const_iterator it = obj.coef.begin(); it != obj.coef.end(); ++it) {
    map<string, int>::const_iterator c = colIdx.find(it->first);
    if(c == colIdx.end()) {
      printf("WARNING: Dropping removed variable %s from the objective\n", it->first.c_str());
      continue;
    }
    glp_set_obj_coef(problem, c->second + 1, it->second);
  }

  int (*func)(void*, const char *) = &suppressGLPKOutput;
  if(!_db.DEBUGMILP) { glp_term_hook(func, NULL); }
  else { glp_term_hook(NULL, NULL); }
}

int GLPKMILP::solveLp(map<string, double> &primals, double &objValue) {
  glp_smcp param;
  glp_init_smcp(&param);
  /* Without presolving I obtain a basic solution that is not feasible... that isn't useful */
  param.presolve = GLP_ON;
  /* Use dual and then switch to primal if dual fails */
  param.meth = GLP_DUALP;
  param.msg_lev = _db.DEBUGMILP ? GLP_MSG_ALL : GLP_MSG_OFF;
  param.tm_lim = (params.timeout * 1000.0f >= INT_MAX) ? INT_MAX : (int)(params.timeout * 1000.0f);

  /*Scale problem with equilibrium scaling to improve numerical stability */
  glp_scale_prob(problem, GLP_SF_EQ);

  int res = glp_simplex(problem, &param);
  if(res != 0) {
    reportFailure(res);
    return statusFromGlpk(res);
  }

  int status = glp_get_status(problem);
  if(status == GLP_UNBND) { printf("ERROR: Problem is unbounded\n"); return SOLVE_UNBOUNDED; }
  if(status == GLP_NOFEAS || status == GLP_INFEAS) { printf("ERROR: Problem has no feasible solution\n"); return SOLVE_INFEASIBLE; }
  if(status != GLP_OPT) { printf("ERROR: Simplex finished without an optimal solution (status %d)\n", status); return SOLVE_NUMERICAL; }

  objValue = glp_get_obj_val(problem);
  /* GLPK doesn't rearrange columns */
  for(int j=0; j<cols.size(); j++) {
    primals[cols[j].name] = glp_get_col_prim(problem, j+1);
  }
  return SOLVE_SUCCESS;
}

int GLPKMILP::solveMilp(map<string, double> &primals, double &objValue) {
  glp_iocp param;
  glp_init_iocp(&param);
  /* The presolver solves the LP relaxation for us, so no glp_simplex call beforehand */
  param.presolve = GLP_ON;
  param.msg_lev = _db.DEBUGMILP ? GLP_MSG_ALL : GLP_MSG_OFF;
  param.tol_int = params.feasibility;
  param.mip_gap = params.mipGap;
  param.tm_lim = (params.timeout * 1000.0f >= INT_MAX) ? INT_MAX : (int)(params.timeout * 1000.0f);

  int res = glp_intopt(problem, &param);
  int status = glp_mip_status(problem);

  /* Stopping early is fine as long as there is an integer feasible point */
  if(res == GLP_ETMLIM || res == GLP_EMIPGAP || res == GLP_ESTOP) {
    if(status != GLP_FEAS && status != GLP_OPT) {
      reportFailure(res);
      return SOLVE_TIMEOUT;
    }
    /* Reaching the requested gap is the normal way out */
    if(res != GLP_EMIPGAP) {
      printf("WARNING: Branch and bound stopped early (GLPK code %d) - using the best integer solution found\n", res);
    }
  } else if(res != 0) {
    reportFailure(res);
    return statusFromGlpk(res);
  }

  if(status == GLP_NOFEAS) { printf("ERROR: Problem has no integer feasible solution\n"); return SOLVE_INFEASIBLE; }
  if(status != GLP_OPT && status != GLP_FEAS) {
    printf("ERROR: Branch and bound finished without a solution (status %d)\n", status);
    return SOLVE_NUMERICAL;
  }

  objValue = glp_mip_obj_val(problem);
  for(int j=0; j<cols.size(); j++) {
    primals[cols[j].name] = glp_mip_col_val(problem, j+1);
  }
  return SOLVE_SUCCESS;
}

int GLPKMILP::statusFromGlpk(int errorCode) {
  if(errorCode == 0) { return SOLVE_SUCCESS; }
  if(errorCode == GLP_ENOPFS) { return SOLVE_INFEASIBLE; }
  if(errorCode == GLP_ENODFS) { return SOLVE_UNBOUNDED; }
  if(errorCode == GLP_ETMLIM) { return SOLVE_TIMEOUT; }
  return SOLVE_NUMERICAL;
}

/* Keep a copy of the problem that failed so that someone can look at it */
void GLPKMILP::reportFailure(int errorCode) {
  printf("ERROR: GLPK failed to solve the problem... see PROBLEMATIC_PROBLEM\n");
  printGlpkError(errorCode);
  glp_write_lp(problem, NULL, "PROBLEMATIC_PROBLEM");
}

int GLPKMILP::suppressGLPKOutput(void *info, const char *s) {
  /* GLPK doesn't print if this function returns 1 so that's what I do */
  return 1;
}

/* Print what numerical error GLPK gave us */
void GLPKMILP::printGlpkError(int errorCode) {
  printf("GLPK error code %d:\n", errorCode);
  if(errorCode == 0) {
    printf("SUCCESSFUL SOLUTION\n");
  }
  if(errorCode == GLP_EBADB) {
    printf("INITIAL BASIS INVALID\n");
  }
  if(errorCode == GLP_ESING) {
    printf("SINGULAR BASIS\n");
  }
  if(errorCode == GLP_ECOND) {
    printf("ILL-CONDITIONED BASIS\n");
  }
  if(errorCode == GLP_EBOUND) {
    printf("INVALID BOUNDS ON VARIABLES\n");
  }
  if(errorCode == GLP_EFAIL) {
    printf("SOLVER FAILED (generic) \n");
  }
  if(errorCode == GLP_EROOT) {
    printf("NO OPTIMAL BASIS FOR THE LP RELAXATION\n");
  }
  if(errorCode == GLP_EOBJLL) {
    printf("DUAL SOLUTION DECREASING WITHOUT BOUND\n");
  }
  if(errorCode == GLP_EOBJUL) {
    printf("DUAL SOLUTION INCREASING WITHOUT BOUND\n");
  }
  if(errorCode == GLP_EITLIM) {
    printf("ITERATION LIMIT EXCEEDED\n");
  }
  if(errorCode == GLP_ETMLIM) {
    printf("TIME LIMIT EXCEEDED\n");
  }
  if(errorCode == GLP_EMIPGAP) {
    printf("RELATIVE MIP GAP TOLERANCE REACHED\n");
  }
  if(errorCode == GLP_ENOPFS) {
    printf("NO PRIMAL SOLUTION [problem infeasible] (presolver)\n");
  }
  if(errorCode == GLP_ENODFS) {
    printf("NO DUAL SOLUTION [problem unbounded] (presolver)\n");
  }
}
