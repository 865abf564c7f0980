#pragma once

#include <steamloc/acf/acf-types.hxx>
#include <steamloc/acf/acf-node.hxx>
#include <steamloc/acf/acf-tokenizer.hxx>
#include <steamloc/acf/acf-parser.hxx>
