#include "realmlink/directory/server_feed.h"

#include <algorithm>
#include <cctype>

#include "realmlink/core/compat.h"

namespace realmlink {
namespace directory {

namespace {

struct Element {
  size_t content_begin;
  size_t content_end;
  // First offset past the closing tag
  size_t next;
};

bool isNameEnd(char c) {
  return c == '>' || c == '/' || std::isspace(static_cast<unsigned char>(c));
}

// First <tag> element in [from, end); nested elements of the same name are
// not supported
optional<Element> findElement(const std::string& xml,
                              const std::string& tag,
                              size_t from,
                              size_t end) {
  const std::string open = "<" + tag;
  const std::string close = "</" + tag + ">";
  size_t pos = from;
  while (true) {
    pos = xml.find(open, pos);
    if (pos == std::string::npos || pos + open.size() >= end) {
      return nullopt;
    }
    if (isNameEnd(xml[pos + open.size()])) {
      break;
    }
    pos += open.size();
  }

  const size_t gt = xml.find('>', pos);
  if (gt == std::string::npos || gt >= end) {
    return nullopt;
  }
  if (xml[gt - 1] == '/') {
    return Element{gt + 1, gt + 1, gt + 1};
  }
  const size_t close_pos = xml.find(close, gt + 1);
  if (close_pos == std::string::npos || close_pos + close.size() > end) {
    return nullopt;
  }
  return Element{gt + 1, close_pos, close_pos + close.size()};
}

std::string trim(const std::string& s) {
  auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) {
    return std::isspace(c);
  });
  auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) {
               return std::isspace(c);
             }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string decodeEntities(const std::string& text) {
  static const std::pair<const char*, char> kEntities[] = {
      {"&amp;", '&'}, {"&lt;", '<'},   {"&gt;", '>'},
      {"&quot;", '"'}, {"&apos;", '\''},
  };
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size();) {
    bool replaced = false;
    if (text[i] == '&') {
      for (const auto& entity : kEntities) {
        const size_t len = std::char_traits<char>::length(entity.first);
        if (text.compare(i, len, entity.first) == 0) {
          out += entity.second;
          i += len;
          replaced = true;
          break;
        }
      }
    }
    if (!replaced) {
      out += text[i++];
    }
  }
  return out;
}

std::string childText(const std::string& xml,
                      const Element& parent,
                      const std::string& tag) {
  auto child =
      findElement(xml, tag, parent.content_begin, parent.content_end);
  if (!child) {
    return "";
  }
  std::string text = trim(xml.substr(
      child->content_begin, child->content_end - child->content_begin));
  const std::string cdata_open = "<![CDATA[";
  if (text.compare(0, cdata_open.size(), cdata_open) == 0 &&
      text.size() >= cdata_open.size() + 3 &&
      text.compare(text.size() - 3, 3, "]]>") == 0) {
    return trim(text.substr(cdata_open.size(),
                            text.size() - cdata_open.size() - 3));
  }
  return decodeEntities(text);
}

}  // namespace

Result<std::vector<ServerDescriptor>> parseServerFeed(const std::string& xml) {
  auto network = findElement(xml, "network", 0, xml.size());
  if (!network) {
    return makeError<std::vector<ServerDescriptor>>(
        errors::kParseError, "Feed has no <network> element");
  }
  auto instances = findElement(xml, "instances", network->content_begin,
                               network->content_end);
  if (!instances) {
    return makeError<std::vector<ServerDescriptor>>(
        errors::kParseError, "Feed has no <instances> element");
  }

  std::vector<ServerDescriptor> servers;
  size_t pos = instances->content_begin;
  while (auto instance =
             findElement(xml, "instance", pos, instances->content_end)) {
    pos = instance->next;
    ServerDescriptor descriptor;
    descriptor.zone = childText(xml, *instance, "zone");
    descriptor.server = childText(xml, *instance, "server");
    if (descriptor.zone.empty() || descriptor.server.empty()) {
      continue;
    }
    std::string enabled = childText(xml, *instance, "enabled");
    std::transform(enabled.begin(), enabled.end(), enabled.begin(),
                   [](unsigned char c) {
                     return static_cast<char>(std::tolower(c));
                   });
    descriptor.enabled = !(enabled == "false" || enabled == "0");
    servers.push_back(std::move(descriptor));
  }
  return servers;
}

}  // namespace directory
}  // namespace realmlink
