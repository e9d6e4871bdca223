#include "herald/compose/compose.hpp"

namespace herald::compose {

namespace {

const std::string DEFAULT_SEP = " ";
const std::string DEFAULT_END = "\n";

bool is_multiline(const std::string &text) {
  return text.find('\n') != std::string::npos;
}

std::string maybe_wrap(const message_s &msg, std::string text) {
  if (msg.wrap.has_value() && *msg.wrap > 0) {
    return text::wrap(text, *msg.wrap);
  }
  return text;
}

} // namespace

void apply(message_s &msg, kw_s arg) {
  msg.kwargs.insert_or_assign(std::move(arg.name), std::move(arg.value));
}

void apply(message_s &msg, opt::sep_s arg) { msg.sep = std::move(arg.value); }

void apply(message_s &msg, opt::end_s arg) { msg.end = std::move(arg.value); }

void apply(message_s &msg, opt::tmpl_s arg) {
  msg.templates = std::move(arg.candidates);
}

void apply(message_s &msg, opt::remove_s arg) {
  msg.remove = std::move(arg.policy);
}

void apply(message_s &msg, opt::wrap_s arg) { msg.wrap = arg.width; }

void apply(message_s &msg, opt::culprit_s arg) {
  msg.culprit = std::move(arg.entries);
}

void apply(message_s &msg, opt::codicil_s arg) {
  msg.codicil = std::move(arg.lines);
}

void apply(message_s &msg, opt::file_s arg) { msg.file = arg.stream; }

void apply(message_s &msg, opt::flush_s arg) { msg.flush = arg.value; }

void apply(message_s &msg, opt::urgency_s arg) {
  msg.urgency = std::move(arg.value);
}

void merge(message_s &base, const message_s &overrides) {
  for (const auto &arg : overrides.args) {
    base.args.push_back(arg);
  }
  for (const auto &[name, value] : overrides.kwargs) {
    base.kwargs.insert_or_assign(name, value);
  }
  if (overrides.sep) {
    base.sep = overrides.sep;
  }
  if (overrides.end) {
    base.end = overrides.end;
  }
  if (!overrides.templates.empty()) {
    base.templates = overrides.templates;
  }
  if (overrides.remove) {
    base.remove = overrides.remove;
  }
  if (overrides.wrap) {
    base.wrap = overrides.wrap;
  }
  if (overrides.culprit) {
    culprit::culprit_t combined = *overrides.culprit;
    if (base.culprit) {
      combined.insert(combined.end(), base.culprit->begin(),
                      base.culprit->end());
    }
    base.culprit = std::move(combined);
  }
  base.codicil.insert(base.codicil.end(), overrides.codicil.begin(),
                      overrides.codicil.end());
  if (overrides.file) {
    base.file = overrides.file;
  }
  if (overrides.flush) {
    base.flush = overrides.flush;
  }
  if (overrides.urgency) {
    base.urgency = overrides.urgency;
  }
}

types::list_t cull(const types::list_t &values,
                   const remove_policy_c &remove) {
  types::list_t result;
  for (const auto &value : values) {
    if (!remove.removes(value)) {
      result.push_back(value);
    }
  }
  return result;
}

std::string join(const message_s &msg) {
  if (msg.templates.empty()) {
    const auto &sep = msg.sep ? *msg.sep : DEFAULT_SEP;
    std::string body;
    for (std::size_t i = 0; i < msg.args.size(); i++) {
      if (i) {
        body += sep;
      }
      body += msg.args[i].to_string();
    }
    return maybe_wrap(msg, std::move(body));
  }

  static const remove_policy_c falsy;
  const auto &remove = msg.remove ? *msg.remove : falsy;

  std::vector<template_c> candidates;
  candidates.reserve(msg.templates.size());
  for (const auto &text : msg.templates) {
    candidates.emplace_back(text);
  }
  for (const auto &candidate : candidates) {
    if (candidate.is_usable(msg.args, msg.kwargs, remove)) {
      return maybe_wrap(msg, candidate.fill(msg.args, msg.kwargs));
    }
  }
  return maybe_wrap(msg, candidates.back().fill(msg.args, msg.kwargs));
}

std::vector<std::string> codicil_lines(const message_s &msg) {
  std::vector<std::string> lines;
  lines.reserve(msg.codicil.size());
  for (const auto &line : msg.codicil) {
    lines.push_back(maybe_wrap(msg, line));
  }
  return lines;
}

assembled_s layout(const assembly_s &parts) {
  std::string header = parts.header;
  std::string body = parts.body;

  if (!parts.culprit.empty()) {
    if (is_multiline(body)) {
      body = parts.culprit + ":\n" + text::indent(body);
    } else if (body.empty()) {
      body = parts.culprit + ":";
    } else {
      body = parts.culprit + ": " + body;
    }
  }

  int codicil_stops = 0;
  if (parts.continuation) {
    header.clear();
    body = text::indent(body, "    ", 0, parts.stops);
    codicil_stops = parts.stops;
  } else if (!header.empty()) {
    codicil_stops = 1;
    if (parts.culprit.empty() && is_multiline(body)) {
      header = text::rstrip(header);
      body = "\n" + text::indent(body);
    } else if (body.empty()) {
      header = text::rstrip(header);
    }
  }

  for (const auto &line : parts.codicil) {
    body += "\n" + text::indent(line, "    ", 0, codicil_stops);
  }
  return assembled_s{header, body};
}

std::string compose(const message_s &msg, const culprit::culprit_t &culprit,
                    std::string_view culprit_sep) {
  assembly_s parts;
  parts.culprit =
      culprit::join(msg.culprit ? *msg.culprit : culprit, culprit_sep);
  parts.body = join(msg);
  parts.codicil = codicil_lines(msg);
  return layout(parts).text() + (msg.end ? *msg.end : DEFAULT_END);
}

} // namespace herald::compose
