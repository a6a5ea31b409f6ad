#ifndef BITCOIN_OPCODES_HPP
#define BITCOIN_OPCODES_HPP

#include<cstdint>

namespace Bitcoin {

/* The script opcodes used by the escrow tapscripts.  */
enum Opcode : std::uint8_t
{ OP_0 = 0x00
, OP_PUSHBYTES_32 = 0x20
, OP_PUSHDATA1 = 0x4c
, OP_1NEGATE = 0x4f
, OP_1 = 0x51
, OP_16 = 0x60
, OP_DROP = 0x75
, OP_CHECKSEQUENCEVERIFY = 0xb2
, OP_CHECKSIG = 0xac
, OP_CHECKSIGVERIFY = 0xad
};

}

#endif /* !defined(BITCOIN_OPCODES_HPP) */
