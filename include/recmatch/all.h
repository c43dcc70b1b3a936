#ifndef RECMATCH_H
#define RECMATCH_H

#include "util/util.hpp"
#include "index/index.hpp"
#include "pair/pair.hpp"
#include "similarity/similarity.hpp"
#include "filter/filter.hpp"
#include "variator/variator.hpp"
#include "score/score.hpp"
#include "cluster/cluster.hpp"
#include "match/match.hpp"
#include "report/report.hpp"

#endif //RECMATCH_H
