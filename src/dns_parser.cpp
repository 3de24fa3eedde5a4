#include "dnsgate/dns_parser.hpp"

namespace dnsgate {

Error DNSParser::parse(
    const uint8_t* data,
    size_t len,
    DNSParseResult* result
) {
    if (!data || !result) {
        return Error::InvalidHeader;
    }

    if (len < MIN_DNS_QUERY_SIZE) {
        return Error::PacketTooShort;
    }

    // 解析头部
    result->header = reinterpret_cast<const DNSHeader*>(data);

    // 填充解析结果
    result->id = result->header->getId();
    result->flags = result->header->getFlags();
    result->is_query = result->header->isQuery();

    // 检查是否有问题
    if (result->header->getQDCount() == 0) {
        return Error::InvalidHeader;
    }

    // 解析第一个问题
    size_t offset = DNS_HEADER_SIZE;
    result->question.name_offset = offset;

    size_t name_end = 0;
    Error err = parseName(data, len, offset, &name_end);
    if (err != Error::Success) {
        return err;
    }

    // 检查是否有足够空间存储类型和类别
    if (name_end + 4 > len) {
        return Error::TruncatedMessage;
    }

    result->question.qtype = readU16(data + name_end);
    result->question.qclass = readU16(data + name_end + 2);
    result->question_end = name_end + 4;  // 问题部分结束位置

    return Error::Success;
}

Error DNSParser::parseQuery(
    const uint8_t* data,
    size_t len,
    DNSParseResult* result
) {
    Error err = parse(data, len, result);
    if (err != Error::Success) {
        return err;
    }

    if (!result->is_query) {
        return Error::NotQuery;
    }

    // 只处理标准查询
    if (result->header->getOpcode() != 0) {
        return Error::UnsupportedOpcode;
    }

    // 多问题查询无法保证原样回显
    if (result->header->getQDCount() != 1) {
        return Error::InvalidHeader;
    }

    return Error::Success;
}

Error DNSParser::parseName(
    const uint8_t* data,
    size_t len,
    size_t offset,
    size_t* end_offset
) {
    size_t original_offset = offset;
    bool jumped = false;
    size_t jump_count = 0;
    size_t total_len = 0;

    while (jump_count < MAX_LABELS) {
        if (offset >= len) {
            return Error::TruncatedMessage;
        }

        uint8_t label_len = data[offset];

        // 域名结束
        if (label_len == 0) {
            if (!jumped) {
                *end_offset = offset + 1;
            } else {
                *end_offset = original_offset + 2;
            }
            return Error::Success;
        }

        // 压缩指针
        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= len) {
                return Error::TruncatedMessage;
            }

            size_t ptr = (static_cast<size_t>(label_len & 0x3F) << 8) | data[offset + 1];
            if (ptr >= len) {
                return Error::PointerLoop;
            }

            if (!jumped) {
                original_offset = offset;
                jumped = true;
            }

            offset = ptr;
            jump_count++;
            continue;
        }

        // 普通标签
        if (label_len > MAX_LABEL_LENGTH) {
            return Error::InvalidLabel;
        }

        if (offset + 1 + label_len > len) {
            return Error::TruncatedMessage;
        }

        total_len += 1 + label_len;
        if (total_len + 1 > MAX_DOMAIN_LENGTH) {
            return Error::InvalidLabel;
        }
        offset += 1 + label_len;
    }

    return Error::PointerLoop;
}

Error DNSParser::decodeName(
    const uint8_t* packet,
    size_t packet_len,
    size_t name_offset,
    char* out_buf,
    size_t buf_size,
    size_t* out_len
) {
    size_t offset = name_offset;
    size_t buf_pos = 0;
    size_t jump_count = 0;
    bool first_label = true;
    bool dotted_label = false;

    while (jump_count < MAX_LABELS) {
        if (offset >= packet_len) {
            return Error::TruncatedMessage;
        }

        uint8_t label_len = packet[offset];

        if (label_len == 0) {
            if (buf_pos < buf_size) {
                out_buf[buf_pos] = '\0';
            }
            *out_len = buf_pos;
            return dotted_label ? Error::UnsupportedName : Error::Success;
        }

        // 压缩指针
        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= packet_len) {
                return Error::TruncatedMessage;
            }
            offset = (static_cast<size_t>(label_len & 0x3F) << 8) | packet[offset + 1];
            jump_count++;
            continue;
        }

        if (label_len > MAX_LABEL_LENGTH) {
            return Error::InvalidLabel;
        }

        if (offset + 1 + label_len > packet_len) {
            return Error::TruncatedMessage;
        }

        // 添加点分隔符
        if (!first_label) {
            if (buf_pos >= buf_size) {
                return Error::BufferTooSmall;
            }
            out_buf[buf_pos++] = '.';
        }
        first_label = false;

        // 复制标签
        if (buf_pos + label_len > buf_size) {
            return Error::BufferTooSmall;
        }

        offset++;
        for (uint8_t i = 0; i < label_len; i++) {
            uint8_t c = packet[offset + i];
            // 标签内的点在文本形式中无法与分隔符区分, 照常解码并报告
            if (c == '.') {
                dotted_label = true;
            }
            out_buf[buf_pos++] = static_cast<char>(std::tolower(c));
        }
        offset += label_len;
    }

    return Error::PointerLoop;
}

Error DNSParser::questionName(
    const uint8_t* packet,
    size_t packet_len,
    const DNSParseResult& parsed,
    std::string* out
) {
    char domain_buf[MAX_DOMAIN_LENGTH + 1];
    size_t domain_len = 0;

    Error err = decodeName(packet, packet_len, parsed.question.name_offset,
                           domain_buf, sizeof(domain_buf), &domain_len);
    if (err != Error::Success && err != Error::UnsupportedName) {
        return err;
    }

    out->assign(domain_buf, domain_len);
    out->push_back('.');
    return err;
}

// ==================== DNS Response Builder ====================

size_t DNSResponseBuilder::copyQuestion(
    const uint8_t* query,
    const DNSParseResult& parsed,
    uint8_t rcode,
    bool authoritative,
    uint16_t an_count,
    uint8_t* response,
    size_t response_buf_size
) {
    if (response_buf_size < parsed.question_end) {
        return 0;
    }

    // 复制头部与问题
    std::memcpy(response, query, parsed.question_end);

    // 保留 OPCODE 与 RD, 其余标志位重写
    DNSHeader* hdr = reinterpret_cast<DNSHeader*>(response);
    uint16_t flags = parsed.flags & 0x7900;
    flags |= 0x8000;  // QR = 1 (response)
    flags |= 0x0080;  // RA = 1
    if (authoritative) {
        flags |= 0x0400;  // AA = 1
    }
    flags |= rcode & 0x0F;
    hdr->flags = hton16(flags);

    // 设置计数
    hdr->qd_count = hton16(1);
    hdr->an_count = hton16(an_count);
    hdr->ns_count = 0;
    hdr->ar_count = 0;

    return parsed.question_end;
}

size_t DNSResponseBuilder::writeAnswerHeader(
    uint8_t* response,
    size_t offset,
    const DNSParseResult& parsed,
    uint16_t type,
    uint32_t ttl,
    uint16_t rdlength
) {
    // 域名指针 (指向问题中的域名)
    response[offset++] = 0xC0;
    response[offset++] = DNS_HEADER_SIZE;

    writeU16(response + offset, type);
    offset += 2;

    writeU16(response + offset, parsed.question.qclass);
    offset += 2;

    writeU32(response + offset, ttl);
    offset += 4;

    writeU16(response + offset, rdlength);
    offset += 2;

    return offset;
}

size_t DNSResponseBuilder::buildRefused(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    uint8_t* response,
    size_t response_buf_size
) {
    if (query_len < parsed.question_end) {
        return 0;
    }
    return copyQuestion(query, parsed, dns_rcode::REFUSED, false, 0,
                        response, response_buf_size);
}

size_t DNSResponseBuilder::buildServFail(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    uint8_t* response,
    size_t response_buf_size
) {
    if (query_len < parsed.question_end) {
        return 0;
    }
    return copyQuestion(query, parsed, dns_rcode::SERVFAIL, false, 0,
                        response, response_buf_size);
}

size_t DNSResponseBuilder::buildNoData(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    uint8_t* response,
    size_t response_buf_size
) {
    if (query_len < parsed.question_end) {
        return 0;
    }
    return copyQuestion(query, parsed, dns_rcode::NOERROR, true, 0,
                        response, response_buf_size);
}

size_t DNSResponseBuilder::buildAResponse(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    uint32_t ip,
    uint32_t ttl,
    uint8_t* response,
    size_t response_buf_size
) {
    // 需要空间: 查询 + 回答记录 (域名指针2 + 类型2 + 类别2 + TTL4 + 长度2 + IP4 = 16)
    size_t answer_size = 16;
    size_t total_size = parsed.question_end + answer_size;

    if (query_len < parsed.question_end || response_buf_size < total_size) {
        return 0;
    }

    size_t offset = copyQuestion(query, parsed, dns_rcode::NOERROR, true, 1,
                                 response, response_buf_size);
    offset = writeAnswerHeader(response, offset, parsed, dns_type::A, ttl, 4);

    // IP 地址
    std::memcpy(response + offset, &ip, 4);
    offset += 4;

    return offset;
}

size_t DNSResponseBuilder::buildAAAAResponse(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    const uint8_t* ipv6,
    uint32_t ttl,
    uint8_t* response,
    size_t response_buf_size
) {
    // 需要空间: 查询 + 回答记录 (域名指针2 + 类型2 + 类别2 + TTL4 + 长度2 + IPv6 16 = 28)
    size_t answer_size = 28;
    size_t total_size = parsed.question_end + answer_size;

    if (query_len < parsed.question_end || response_buf_size < total_size) {
        return 0;
    }

    size_t offset = copyQuestion(query, parsed, dns_rcode::NOERROR, true, 1,
                                 response, response_buf_size);
    offset = writeAnswerHeader(response, offset, parsed, dns_type::AAAA, ttl, 16);

    // IPv6 地址 (16 字节)
    std::memcpy(response + offset, ipv6, 16);
    offset += 16;

    return offset;
}

size_t DNSResponseBuilder::buildTXTResponse(
    const uint8_t* query,
    size_t query_len,
    const DNSParseResult& parsed,
    const char* text,
    size_t text_len,
    uint32_t ttl,
    uint8_t* response,
    size_t response_buf_size
) {
    // 每个字符串最多 255 字节, 前缀 1 字节长度; 空文本也写一个空字符串
    size_t chunks = text_len == 0 ? 1 : (text_len + 254) / 255;
    size_t rdlength = text_len + chunks;
    if (rdlength > 0xFFFF) {
        return 0;
    }

    size_t total_size = parsed.question_end + 12 + rdlength;
    if (query_len < parsed.question_end || response_buf_size < total_size) {
        return 0;
    }

    size_t offset = copyQuestion(query, parsed, dns_rcode::NOERROR, true, 1,
                                 response, response_buf_size);
    offset = writeAnswerHeader(response, offset, parsed, dns_type::TXT, ttl,
                               static_cast<uint16_t>(rdlength));

    size_t pos = 0;
    do {
        size_t n = text_len - pos;
        if (n > 255) n = 255;
        response[offset++] = static_cast<uint8_t>(n);
        if (n > 0) {
            std::memcpy(response + offset, text + pos, n);
        }
        offset += n;
        pos += n;
    } while (pos < text_len);

    return offset;
}

} // namespace dnsgate
