/*!
 * @file
 * @brief The public interface of the DSL for describing simulations.
 */

#pragma once

#include <hoverkit/dsl/http_body.hpp>
#include <hoverkit/dsl/response_builder.hpp>
#include <hoverkit/dsl/simulation_source.hpp>
#include <hoverkit/dsl/stub_service_builder.hpp>
#include <hoverkit/dsl/text_matcher.hpp>
