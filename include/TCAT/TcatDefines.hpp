// include/TCAT/TcatDefines.hpp
#pragma once

// Register layout of the TCAT protocol. All offsets are relative to TCAT_BASE_ADDRESS
// unless noted otherwise.

#define TCAT_BASE_ADDRESS                   0xffffe0000000ULL
#define TCAT_MAX_FRAME_SIZE                 512
#define TCAT_QUADLET_SIZE                   4

// General section table at offset 0
#define TCAT_GENERAL_SECTION_COUNT          5
#define TCAT_SECTION_ENTRY_SIZE             8
#define TCAT_GENERAL_SECTIONS_SIZE          (TCAT_GENERAL_SECTION_COUNT * TCAT_SECTION_ENTRY_SIZE)

// Extension section table
#define TCAT_EXTENSION_OFFSET               0x00200000
#define TCAT_EXTENSION_SECTION_COUNT        9
#define TCAT_EXTENSION_SECTIONS_SIZE        (TCAT_EXTENSION_SECTION_COUNT * TCAT_SECTION_ENTRY_SIZE)

// Global section fields
#define TCAT_GLOBAL_OWNER                   0x00
#define TCAT_GLOBAL_NOTIFICATION            0x08
#define TCAT_GLOBAL_NICKNAME                0x0c
#define TCAT_GLOBAL_NICKNAME_SIZE           64
#define TCAT_GLOBAL_CLOCK_SELECT            0x4c
#define TCAT_GLOBAL_ENABLE                  0x50
#define TCAT_GLOBAL_STATUS                  0x54
#define TCAT_GLOBAL_EXTENDED_STATUS         0x58
#define TCAT_GLOBAL_SAMPLE_RATE             0x5c
#define TCAT_GLOBAL_MIN_SIZE                0x60
#define TCAT_GLOBAL_VERSION                 0x60
#define TCAT_GLOBAL_CLOCK_CAPS              0x64
#define TCAT_GLOBAL_CLOCK_SOURCE_NAMES      0x68
#define TCAT_GLOBAL_CLOCK_SOURCE_NAMES_SIZE 256
#define TCAT_GLOBAL_EXTENDED_SIZE           (TCAT_GLOBAL_CLOCK_SOURCE_NAMES + TCAT_GLOBAL_CLOCK_SOURCE_NAMES_SIZE)

#define TCAT_CLOCK_SOURCE_MASK              0x000000ff
#define TCAT_CLOCK_RATE_MASK                0x0000ff00
#define TCAT_CLOCK_RATE_SHIFT               8
#define TCAT_STATUS_SOURCE_LOCKED           0x00000001

// Notification bits
#define TCAT_NOTIFY_RX_CFG_CHG              0x00000001
#define TCAT_NOTIFY_TX_CFG_CHG              0x00000002
#define TCAT_NOTIFY_LOCK_CHG                0x00000010
#define TCAT_NOTIFY_CLOCK_ACCEPTED          0x00000020
#define TCAT_NOTIFY_EXT_STATUS              0x00000040

// Capability section
#define TCAT_CAPS_SIZE                      12
#define TCAT_CAPS_ROUTER                    0x00
#define TCAT_CAPS_MIXER                     0x04
#define TCAT_CAPS_GENERAL                   0x08

#define TCAT_CAP_EXPOSED                    0x01
#define TCAT_CAP_READONLY                   0x02
#define TCAT_CAP_STORABLE                   0x04

#define TCAT_CAP_GENERAL_DYNAMIC_STREAM     0x01
#define TCAT_CAP_GENERAL_STORAGE            0x02
#define TCAT_CAP_GENERAL_PEAK               0x04
#define TCAT_CAP_GENERAL_STREAM_STORABLE    0x10

// Command section
#define TCAT_CMD_OPCODE                     0x00
#define TCAT_CMD_RETURN                     0x04
#define TCAT_CMD_EXECUTE                    0x80000000
#define TCAT_CMD_RATE_LOW                   0x00010000
#define TCAT_CMD_RATE_MIDDLE                0x00020000
#define TCAT_CMD_RATE_HIGH                  0x00040000
#define TCAT_CMD_OP_NOOP                    0x00
#define TCAT_CMD_OP_LOAD_ROUTER             0x01
#define TCAT_CMD_OP_LOAD_STREAM_CONFIG      0x02
#define TCAT_CMD_OP_LOAD_ROUTER_STREAM      0x03
#define TCAT_CMD_OP_LOAD_FLASH              0x04
#define TCAT_CMD_OP_STORE_FLASH             0x05

// Current configuration section, one router/stream-format pair per rate mode
#define TCAT_CURR_CFG_LOW_ROUTER            0x0000
#define TCAT_CURR_CFG_LOW_STREAM            0x1000
#define TCAT_CURR_CFG_MID_ROUTER            0x2000
#define TCAT_CURR_CFG_MID_STREAM            0x3000
#define TCAT_CURR_CFG_HIGH_ROUTER           0x4000
#define TCAT_CURR_CFG_HIGH_STREAM           0x5000

// Router entries
#define TCAT_ROUTER_ENTRY_SIZE              4
#define TCAT_ROUTER_PEAK_MASK               0xffff0000
#define TCAT_ROUTER_PEAK_SHIFT              16
#define TCAT_ROUTER_SRC_MASK                0x0000ff00
#define TCAT_ROUTER_SRC_SHIFT               8
#define TCAT_ROUTER_DST_MASK                0x000000ff

// Stream format entries
#define TCAT_FORMAT_ENTRY_SIZE              268
#define TCAT_FORMAT_LABELS_SIZE             256
#define TCAT_FORMAT_AC3_CHANNELS            32

// Standalone section
#define TCAT_STANDALONE_SIZE                20
